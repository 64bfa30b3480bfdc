// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#include <mutex>
#include <sys/stat.h>
#include <sys/xattr.h>
#include "test_utils.h"
#include "../RoboMirror/Source/base/transfer.h"

using namespace rbm;
using namespace robo;
using namespace robo::test;


namespace
{
//records the offset of every source stream opened
class OffsetRecordingFileSystem : public NativeFileSystem
{
public:
    std::unique_ptr<InputStream> getInputStream(const Zstring& filePath, uint64_t offset) const override
    {
        std::lock_guard dummy(lockOffsets_);
        offsets_.push_back(offset);
        return NativeFileSystem::getInputStream(filePath, offset);
    }

    std::vector<uint64_t> getOffsets() const
    {
        std::lock_guard dummy(lockOffsets_);
        return offsets_;
    }

private:
    mutable std::mutex lockOffsets_;
    mutable std::vector<uint64_t> offsets_;
};


class TimestampFailureFileSystem : public NativeFileSystem
{
public:
    void copyFileTimes(const Zstring& sourcePath, const Zstring& targetPath) const override
    {
        throw FileError(replaceCpy(_("Cannot write modification time of %x."), L"%x", fmtPath(targetPath)), L"Injected failure.");
    }
};


//source deletion fails: move mode must keep the copy
class DeleteFailureFileSystem : public NativeFileSystem
{
public:
    void removeFilePlain(const Zstring& filePath) const override
    {
        throw FileError(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(filePath)), L"Injected failure.");
    }
};
}


class TransferTest : public TempDirTest
{
protected:
    CandidateFile makeSourceFile(const Zstring& relPath, const std::string& content)
    {
        const Zstring filePath = appendPath(sourceDir_, relPath);
        writeFile(filePath, content);
        const std::optional<ItemDetails> details = getItemDetailsIfExists(filePath);
        EXPECT_TRUE(details);
        return {filePath, relPath, content.size(), details ? details->modTime : timespec{}};
    }

    Zstring getTargetPath(const CandidateFile& file) const { return appendPath(targetDir_, file.relPath); }
};


TEST_F(TransferTest, SmallFileIsCopied)
{
    const std::string content = "0123456789";
    const CandidateFile file = makeSourceFile("small.txt", content);

    const TransferResult result = transferFile(file, getTargetPath(file), makeConfig(), NativeFileSystem(), nullptr);

    const auto* copied = std::get_if<OutcomeCopied>(&result.outcome);
    ASSERT_TRUE(copied);
    EXPECT_EQ(copied->bytes, 10u);
    EXPECT_EQ(copied->targetPath, getTargetPath(file));
    EXPECT_EQ(result.foldersCreated, std::vector<Zstring>{targetDir_});

    EXPECT_EQ(readFile(getTargetPath(file)), content);
    EXPECT_FALSE(exists(getTargetPath(file) + PARTIAL_FILE_ENDING));
}


TEST_F(TransferTest, ReportsBytesActuallyCopied)
{
    const CandidateFile file = makeSourceFile("grown.txt", "hello");
    writeFile(file.sourcePath, "hello world"); //changed after enumeration

    const TransferResult result = transferFile(file, getTargetPath(file), makeConfig(), NativeFileSystem(), nullptr);

    const auto* copied = std::get_if<OutcomeCopied>(&result.outcome);
    ASSERT_TRUE(copied);
    EXPECT_EQ(copied->bytes, 11u);
    EXPECT_EQ(readFile(getTargetPath(file)), "hello world");
}


TEST_F(TransferTest, LargeFileIsStreamedInChunks)
{
    const std::string content = makeContent(SMALL_FILE_THRESHOLD + 12345);
    const CandidateFile file = makeSourceFile("sub/large.bin", content);

    std::vector<uint64_t> progress;
    const TransferResult result = transferFile(file, getTargetPath(file), makeConfig(), NativeFileSystem(),
    [&](uint64_t bytesWritten, uint64_t bytesTotal)
    {
        EXPECT_EQ(bytesTotal, content.size());
        progress.push_back(bytesWritten);
    });

    ASSERT_TRUE(std::holds_alternative<OutcomeCopied>(result.outcome));
    EXPECT_EQ(readFile(getTargetPath(file)), content);

    const std::vector<uint64_t> expected{TRANSFER_CHUNK_SIZE, 2 * TRANSFER_CHUNK_SIZE, content.size()};
    EXPECT_EQ(progress, expected);
}


TEST_F(TransferTest, ResumesFromPartialFile)
{
    const std::string content = makeContent(3 * TRANSFER_CHUNK_SIZE + 123);
    const CandidateFile file = makeSourceFile("resume.bin", content);

    //interrupted transfer: K bytes durably written
    const size_t resumeOffset = TRANSFER_CHUNK_SIZE + TRANSFER_CHUNK_SIZE / 2 + 7;
    writeFile(getTargetPath(file) + PARTIAL_FILE_ENDING, content.substr(0, resumeOffset));

    std::vector<uint64_t> progress;
    const OffsetRecordingFileSystem afs;
    const TransferResult result = transferFile(file, getTargetPath(file), makeConfig(), afs,
                                               [&](uint64_t bytesWritten, uint64_t /*bytesTotal*/) { progress.push_back(bytesWritten); });

    ASSERT_TRUE(std::holds_alternative<OutcomeCopied>(result.outcome));
    EXPECT_EQ(readFile(getTargetPath(file)), content);
    EXPECT_FALSE(exists(getTargetPath(file) + PARTIAL_FILE_ENDING));

    //nothing before the resume offset is read again
    EXPECT_EQ(afs.getOffsets(), std::vector<uint64_t>{resumeOffset});
    ASSERT_FALSE(progress.empty());
    EXPECT_EQ(progress.front(), resumeOffset + TRANSFER_CHUNK_SIZE);
    EXPECT_EQ(progress.back(), content.size());
}


TEST_F(TransferTest, ResumesSmallFileFromPartial)
{
    const std::string content = makeContent(1000);
    const CandidateFile file = makeSourceFile("small.bin", content);
    writeFile(getTargetPath(file) + PARTIAL_FILE_ENDING, content.substr(0, 400));

    const OffsetRecordingFileSystem afs;
    const TransferResult result = transferFile(file, getTargetPath(file), makeConfig(), afs, nullptr);

    ASSERT_TRUE(std::holds_alternative<OutcomeCopied>(result.outcome));
    EXPECT_EQ(readFile(getTargetPath(file)), content);
    EXPECT_EQ(afs.getOffsets(), std::vector<uint64_t>{400});
}


TEST_F(TransferTest, StalePartialFileIsDiscarded)
{
    const std::string content = makeContent(SMALL_FILE_THRESHOLD + 1);
    const CandidateFile file = makeSourceFile("stale.bin", content);

    //not smaller than the source: cannot be a prefix of it
    writeFile(getTargetPath(file) + PARTIAL_FILE_ENDING, makeContent(content.size() + 10, 2));

    const OffsetRecordingFileSystem afs;
    const TransferResult result = transferFile(file, getTargetPath(file), makeConfig(), afs, nullptr);

    ASSERT_TRUE(std::holds_alternative<OutcomeCopied>(result.outcome));
    EXPECT_EQ(readFile(getTargetPath(file)), content);
    EXPECT_EQ(afs.getOffsets(), std::vector<uint64_t>{0});
}


TEST_F(TransferTest, ResumeDisabledRestartsTransfer)
{
    const std::string content = makeContent(SMALL_FILE_THRESHOLD + 100);
    const CandidateFile file = makeSourceFile("restart.bin", content);
    writeFile(getTargetPath(file) + PARTIAL_FILE_ENDING, content.substr(0, 5000));

    JobConfig cfg = makeConfig();
    cfg.resumePartial = false;

    const OffsetRecordingFileSystem afs;
    const TransferResult result = transferFile(file, getTargetPath(file), cfg, afs, nullptr);

    ASSERT_TRUE(std::holds_alternative<OutcomeCopied>(result.outcome));
    EXPECT_EQ(readFile(getTargetPath(file)), content);
    EXPECT_EQ(afs.getOffsets(), std::vector<uint64_t>{0});
}


TEST_F(TransferTest, RetrySucceedsAfterTwoFailures)
{
    const CandidateFile file = makeSourceFile("flaky.txt", "flaky data");

    JobConfig cfg = makeConfig();
    cfg.retryCount = 3;

    const FlakyReadFileSystem afs(2);
    const TransferResult result = transferFile(file, getTargetPath(file), cfg, afs, nullptr);

    EXPECT_TRUE(std::holds_alternative<OutcomeCopied>(result.outcome));
    EXPECT_EQ(afs.getReadAttempts(), 3);
    EXPECT_EQ(readFile(getTargetPath(file)), "flaky data");
}


TEST_F(TransferTest, RetrySucceedsForStreamedFile)
{
    const std::string content = makeContent(SMALL_FILE_THRESHOLD * 2);
    const CandidateFile file = makeSourceFile("flaky.bin", content);

    JobConfig cfg = makeConfig();
    cfg.retryCount = 3;

    const FlakyReadFileSystem afs(2);
    const TransferResult result = transferFile(file, getTargetPath(file), cfg, afs, nullptr);

    EXPECT_TRUE(std::holds_alternative<OutcomeCopied>(result.outcome));
    EXPECT_EQ(readFile(getTargetPath(file)), content);
}


TEST_F(TransferTest, RetryExhaustionFails)
{
    const CandidateFile file = makeSourceFile("broken.txt", "data");

    JobConfig cfg = makeConfig();
    cfg.retryCount = 2;

    const FlakyReadFileSystem afs(2);
    const TransferResult result = transferFile(file, getTargetPath(file), cfg, afs, nullptr);

    const auto* failed = std::get_if<OutcomeFailed>(&result.outcome);
    ASSERT_TRUE(failed);
    EXPECT_EQ(failed->path, file.sourcePath);
    EXPECT_NE(failed->errorMsg.find(L"Injected failure."), std::wstring::npos);
    EXPECT_EQ(afs.getReadAttempts(), 2);
    EXPECT_FALSE(exists(getTargetPath(file)));
}


TEST_F(TransferTest, ZeroRetriesStillAttemptsOnce)
{
    const CandidateFile file = makeSourceFile("once.txt", "data");

    JobConfig cfg = makeConfig();
    cfg.retryCount = 0;

    const FlakyReadFileSystem afs(1);
    const TransferResult result = transferFile(file, getTargetPath(file), cfg, afs, nullptr);

    EXPECT_TRUE(std::holds_alternative<OutcomeFailed>(result.outcome));
    EXPECT_EQ(afs.getReadAttempts(), 1);
}


TEST_F(TransferTest, AttributeFailureFailsTransfer)
{
    const CandidateFile file = makeSourceFile("attr.txt", "data");

    const TransferResult result = transferFile(file, getTargetPath(file), makeConfig(), TimestampFailureFileSystem(), nullptr);

    const auto* failed = std::get_if<OutcomeFailed>(&result.outcome);
    ASSERT_TRUE(failed);
    EXPECT_NE(failed->errorMsg.find(L"Injected failure."), std::wstring::npos);
    EXPECT_FALSE(exists(getTargetPath(file))); //never made visible

    //same file system, attribute copy not requested
    JobConfig cfg = makeConfig();
    cfg.copyTimestamps = false;
    EXPECT_TRUE(std::holds_alternative<OutcomeCopied>(transferFile(file, getTargetPath(file), cfg, TimestampFailureFileSystem(), nullptr).outcome));
}


TEST_F(TransferTest, ReplacesExistingTarget)
{
    const CandidateFile file = makeSourceFile("replace.txt", "new content");
    writeFile(getTargetPath(file), "old");

    const TransferResult result = transferFile(file, getTargetPath(file), makeConfig(), NativeFileSystem(), nullptr);

    ASSERT_TRUE(std::holds_alternative<OutcomeCopied>(result.outcome));
    EXPECT_EQ(readFile(getTargetPath(file)), "new content");
}


TEST_F(TransferTest, DryRunDoesNotTouchTarget)
{
    const CandidateFile file = makeSourceFile("dir/dry.txt", "data");

    JobConfig cfg = makeConfig();
    cfg.dryRun = true;

    const TransferResult result = transferFile(file, getTargetPath(file), cfg, NativeFileSystem(), nullptr);

    const auto* skipped = std::get_if<OutcomeSkipped>(&result.outcome);
    ASSERT_TRUE(skipped);
    EXPECT_EQ(skipped->reason, SkipReason::dryRun);
    EXPECT_TRUE(result.foldersCreated.empty());
    EXPECT_FALSE(exists(targetDir_));
}


TEST_F(TransferTest, MoveDeletesSource)
{
    const CandidateFile file = makeSourceFile("move.txt", "data");

    JobConfig cfg = makeConfig();
    cfg.moveFiles = true;

    const TransferResult result = transferFile(file, getTargetPath(file), cfg, NativeFileSystem(), nullptr);

    EXPECT_TRUE(std::holds_alternative<OutcomeCopied>(result.outcome));
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_FALSE(exists(file.sourcePath));
    EXPECT_EQ(readFile(getTargetPath(file)), "data");
}


TEST_F(TransferTest, MoveKeepsCopyWhenSourceDeletionFails)
{
    const CandidateFile file = makeSourceFile("move.txt", "data");

    JobConfig cfg = makeConfig();
    cfg.moveFiles = true;
    cfg.deleteRetryCount = 2;

    const TransferResult result = transferFile(file, getTargetPath(file), cfg, DeleteFailureFileSystem(), nullptr);

    EXPECT_TRUE(std::holds_alternative<OutcomeCopied>(result.outcome));
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_TRUE(exists(file.sourcePath));
    EXPECT_EQ(readFile(getTargetPath(file)), "data");
}


TEST_F(TransferTest, PermissionsAndTimesArePreserved)
{
    const CandidateFile fileTmp = makeSourceFile("attr.bin", makeContent(5000));

    ASSERT_EQ(::chmod(fileTmp.sourcePath.c_str(), 0640), 0);
    const timespec modTime{1600000000, 123456789};
    setFileTimes(fileTmp.sourcePath, modTime, modTime);

    CandidateFile file = fileTmp;
    file.modTime = modTime;

    ASSERT_TRUE(std::holds_alternative<OutcomeCopied>(transferFile(file, getTargetPath(file), makeConfig(), NativeFileSystem(), nullptr).outcome));

    struct stat targetInfo = {};
    ASSERT_EQ(::stat(getTargetPath(file).c_str(), &targetInfo), 0);
    EXPECT_EQ(targetInfo.st_mode & 07777, 0640u);
    EXPECT_EQ(targetInfo.st_mtim.tv_sec, modTime.tv_sec);
}


TEST_F(TransferTest, ExtendedAttributesArePreserved)
{
    const CandidateFile file = makeSourceFile("xattr.txt", "data");

    const char attrName[] = "user.robomirror.test";
    const std::string attrValue = "attribute value";
    if (::setxattr(file.sourcePath.c_str(), attrName, attrValue.data(), attrValue.size(), 0) != 0)
        GTEST_SKIP() << "user extended attributes not supported by the temp file system";

    ASSERT_TRUE(std::holds_alternative<OutcomeCopied>(transferFile(file, getTargetPath(file), makeConfig(), NativeFileSystem(), nullptr).outcome));

    char buffer[256] = {};
    const ssize_t bytesRead = ::getxattr(getTargetPath(file).c_str(), attrName, buffer, sizeof(buffer));
    ASSERT_EQ(bytesRead, static_cast<ssize_t>(attrValue.size()));
    EXPECT_EQ(std::string(buffer, bytesRead), attrValue);
}
