// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#include "test_utils.h"

using namespace rbm;
using namespace robo;
using namespace robo::test;


class ConfigTest : public TempDirTest {};


TEST_F(ConfigTest, DefaultsAreValid)
{
    const JobConfig cfg = makeConfig();
    EXPECT_EQ(cfg.retryCount, 3);
    EXPECT_EQ(cfg.threadCount, 8);
    EXPECT_EQ(JobConfig().retryWait, std::chrono::seconds(5));
    EXPECT_TRUE(cfg.resumePartial);
    EXPECT_TRUE(cfg.copyTimestamps && cfg.copyPermissions && cfg.copyXattr);
    EXPECT_TRUE(cfg.includeSubfolders && cfg.includeEmptyFolders && cfg.skipHidden);

    EXPECT_NO_THROW(validateConfig(cfg, NativeFileSystem()));
}


TEST_F(ConfigTest, InvalidCounts)
{
    JobConfig cfg = makeConfig();
    cfg.threadCount = 0;
    EXPECT_THROW(validateConfig(cfg, NativeFileSystem()), ErrorInvalidThreadCount);

    cfg = makeConfig();
    cfg.retryCount = -1;
    EXPECT_THROW(validateConfig(cfg, NativeFileSystem()), ErrorInvalidRetryCount);

    cfg = makeConfig();
    cfg.retryCount = 0; //treated as one attempt
    EXPECT_NO_THROW(validateConfig(cfg, NativeFileSystem()));
}


TEST_F(ConfigTest, SourceMustBeExistingFolder)
{
    JobConfig cfg = makeConfig();
    cfg.sourcePath = appendPath(rootDir_, "missing");
    EXPECT_THROW(validateConfig(cfg, NativeFileSystem()), ErrorSourceNotFound);

    const Zstring filePath = appendPath(rootDir_, "file.txt");
    writeFile(filePath, "data");
    cfg.sourcePath = filePath;
    EXPECT_THROW(validateConfig(cfg, NativeFileSystem()), ErrorSourceNotFolder);
}


TEST_F(ConfigTest, SizeRange)
{
    JobConfig cfg = makeConfig();
    cfg.minFileSize = 100;
    cfg.maxFileSize = 10;
    EXPECT_THROW(validateConfig(cfg, NativeFileSystem()), FileError);

    cfg.maxFileSize = 100;
    EXPECT_NO_THROW(validateConfig(cfg, NativeFileSystem()));
}


TEST(JobConfig, ReconcileRequested)
{
    JobConfig cfg;
    EXPECT_FALSE(reconcileRequested(cfg));

    cfg.mirror = true;
    EXPECT_TRUE(reconcileRequested(cfg));

    cfg.excludeExtra = true;
    EXPECT_FALSE(reconcileRequested(cfg));

    cfg.mirror = false;
    cfg.excludeExtra = false;
    cfg.purge = true;
    EXPECT_TRUE(reconcileRequested(cfg));
}
