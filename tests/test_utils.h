// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef TEST_UTILS_H_2210938475610293
#define TEST_UTILS_H_2210938475610293

#include <cstdlib>
#include <atomic>
#include <gtest/gtest.h>
#include <rbm/file_access.h>
#include <rbm/file_io.h>
#include <rbm/file_path.h>
#include "../RoboMirror/Source/afs/native.h"
#include "../RoboMirror/Source/base/process_callback.h"


namespace robo::test
{
//one empty source folder per test, target folder not yet existing
class TempDirTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        const char* tmpDir = std::getenv("TMPDIR");
        Zstring pathTemplate = rbm::appendPath(tmpDir && *tmpDir ? Zstring(tmpDir) : Zstring("/tmp"), "robomirror_test_XXXXXX");

        ASSERT_NE(::mkdtemp(pathTemplate.data()), nullptr) << "mkdtemp failed";
        rootDir_ = pathTemplate;

        sourceDir_ = rbm::appendPath(rootDir_, "source");
        targetDir_ = rbm::appendPath(rootDir_, "target");
        ASSERT_NO_THROW(rbm::createDirectory(sourceDir_));
    }

    void TearDown() override
    {
        if (!rootDir_.empty())
            try
            {
                rbm::removeDirectoryPlainRecursion(rootDir_); //throw FileError
            }
            catch (const rbm::FileError& e) { ADD_FAILURE() << rbm::utfTo<std::string>(e.toString()); }
    }

    JobConfig makeConfig() const
    {
        JobConfig cfg;
        cfg.sourcePath = sourceDir_;
        cfg.targetPath = targetDir_;
        cfg.retryWait = std::chrono::seconds(0);
        cfg.deleteRetryWait = std::chrono::milliseconds(0);
        return cfg;
    }

    //parent folders are created as needed
    static void writeFile(const Zstring& filePath, const std::string& content)
    {
        if (const std::optional<Zstring> parentPath = rbm::getParentFolderPath(filePath))
            rbm::createDirectoryIfMissingRecursion(*parentPath); //throw FileError
        rbm::setFileContent(filePath, content, nullptr); //throw FileError
    }

    static std::string readFile(const Zstring& filePath) { return rbm::getFileContent(filePath, nullptr); } //throw FileError

    //not compressible, not repeating at chunk boundaries
    static std::string makeContent(size_t size, unsigned int seed = 1)
    {
        std::string content(size, '\0');
        uint32_t state = seed * 2654435761u + 1;
        for (char& c : content)
        {
            state = state * 1664525u + 1013904223u;
            c = static_cast<char>(state >> 24);
        }
        return content;
    }

    static bool exists(const Zstring& itemPath) { return rbm::itemExists(itemPath); } //throw FileError

    Zstring rootDir_;
    Zstring sourceDir_;
    Zstring targetDir_;
};


//fails the first "failCount" attempts to read the source
class FlakyReadFileSystem : public NativeFileSystem
{
public:
    explicit FlakyReadFileSystem(int failCount) : failCount_(failCount) {}

    std::unique_ptr<InputStream> getInputStream(const Zstring& filePath, uint64_t offset) const override
    {
        failIfRequested(filePath); //throw FileError
        return NativeFileSystem::getInputStream(filePath, offset);
    }

    uint64_t copyNewFile(const Zstring& sourcePath, const Zstring& targetPath, const rbm::IoCallback& notifyUnbufferedIO) const override
    {
        failIfRequested(sourcePath); //throw FileError
        return NativeFileSystem::copyNewFile(sourcePath, targetPath, notifyUnbufferedIO);
    }

    int getReadAttempts() const { return readAttempts_; }

private:
    void failIfRequested(const Zstring& filePath) const
    {
        if (++readAttempts_ <= failCount_)
            throw rbm::FileError(rbm::replaceCpy(_("Cannot read file %x."), L"%x", rbm::fmtPath(filePath)), L"Injected failure.");
    }

    const int failCount_;
    mutable std::atomic<int> readAttempts_{0};
};


//records everything the engine reports
class TestCallback : public ProcessCallback
{
public:
    void initNewPhase(int itemsTotal, int64_t bytesTotal, ProcessPhase phaseId) override { phases.push_back(phaseId); }
    void reportScanProgress(int itemsScanned, int filesFound) override {}
    void reportOutcome(const OperationOutcome& outcome) override { outcomes.push_back(outcome); }
    void updateProgress(int itemsDone, int64_t bytesDone) override {}
    void logMessage(const std::wstring& msg, MsgType type) override
    {
        (type == MsgType::warning ? warnings : messages).push_back(msg);
    }

    template <class T>
    std::vector<T> getOutcomes() const
    {
        std::vector<T> output;
        for (const OperationOutcome& outcome : outcomes)
            if (const T* o = std::get_if<T>(&outcome))
                output.push_back(*o);
        return output;
    }

    std::vector<ProcessPhase> phases;
    std::vector<OperationOutcome> outcomes;
    std::vector<std::wstring> messages;
    std::vector<std::wstring> warnings;
};
}

#endif //TEST_UTILS_H_2210938475610293
