// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#include <gtest/gtest.h>
#include "../RoboMirror/Source/cmd_line.h"

using namespace rbm;
using namespace robo;


TEST(ParseFileSize, PlainAndSuffixed)
{
    EXPECT_EQ(parseFileSize("0"), 0u);
    EXPECT_EQ(parseFileSize("512"), 512u);
    EXPECT_EQ(parseFileSize("10K"), 10u * 1024);
    EXPECT_EQ(parseFileSize("10k"), 10u * 1024);
    EXPECT_EQ(parseFileSize("3M"), 3u * 1024 * 1024);
    EXPECT_EQ(parseFileSize("2G"), 2ULL * 1024 * 1024 * 1024);
    EXPECT_EQ(parseFileSize("1t"), 1024ULL * 1024 * 1024 * 1024);
    EXPECT_EQ(parseFileSize(" 7K "), 7u * 1024);
}


TEST(ParseFileSize, Invalid)
{
    EXPECT_THROW(parseFileSize(""), SysError);
    EXPECT_THROW(parseFileSize("K"), SysError);
    EXPECT_THROW(parseFileSize("1.5M"), SysError);
    EXPECT_THROW(parseFileSize("-1"), SysError);
    EXPECT_THROW(parseFileSize("10X"), SysError);
    EXPECT_THROW(parseFileSize("99999999999999999999"), SysError);
    EXPECT_THROW(parseFileSize("20000000T"), SysError); //overflow
}


TEST(ParseCommandLine, Defaults)
{
    const CommandLineConfig cfg = parseCommandLine({"/src", "/dst"});

    EXPECT_EQ(cfg.job.sourcePath, "/src");
    EXPECT_EQ(cfg.job.targetPath, "/dst");
    EXPECT_EQ(cfg.verbosity, Verbosity::normal);
    EXPECT_TRUE(cfg.logFilePath.empty());
    EXPECT_FALSE(cfg.showHelp);
    EXPECT_FALSE(cfg.job.mirror);
    EXPECT_EQ(cfg.job.threadCount, 8);
}


TEST(ParseCommandLine, RobocopyOptions)
{
    const CommandLineConfig cfg = parseCommandLine({"/src", "/dst", "/mir", "/R:5", "/W:1", "/MT:16", "/XO", "/IS",
                                                    "/MIN:1K", "/MAX:2m", "/COPY:DT", "/L", "/V", "/LOG+:/tmp/run.log", "--no-resume"});
    EXPECT_TRUE(cfg.job.mirror);
    EXPECT_EQ(cfg.job.retryCount, 5);
    EXPECT_EQ(cfg.job.retryWait, std::chrono::seconds(1));
    EXPECT_EQ(cfg.job.threadCount, 16);
    EXPECT_TRUE(cfg.job.excludeOlder);
    EXPECT_TRUE(cfg.job.includeSame);
    EXPECT_EQ(cfg.job.minFileSize, 1024u);
    EXPECT_EQ(cfg.job.maxFileSize, 2u * 1024 * 1024);
    EXPECT_TRUE (cfg.job.copyTimestamps);
    EXPECT_FALSE(cfg.job.copyPermissions);
    EXPECT_FALSE(cfg.job.copyXattr);
    EXPECT_TRUE(cfg.job.dryRun);
    EXPECT_EQ(cfg.verbosity, Verbosity::verbose);
    EXPECT_EQ(cfg.logFilePath, "/tmp/run.log");
    EXPECT_TRUE(cfg.logAppend);
    EXPECT_FALSE(cfg.job.resumePartial);
}


TEST(ParseCommandLine, PatternListsEndAtNextOption)
{
    const CommandLineConfig cfg = parseCommandLine({"/src", "/dst", "/XF", "*.tmp", "*.bak", "/XD", ".git", "build", "/IF", "*.cpp", "/Q"});

    EXPECT_EQ(cfg.job.excludeFiles,   (std::vector<Zstring>{"*.tmp", "*.bak"}));
    EXPECT_EQ(cfg.job.excludeFolders, (std::vector<Zstring>{".git", "build"}));
    EXPECT_EQ(cfg.job.includeFiles,   (std::vector<Zstring>{"*.cpp"}));
    EXPECT_EQ(cfg.verbosity, Verbosity::quiet);
}


TEST(ParseCommandLine, FolderAndMoveOptions)
{
    const CommandLineConfig cfg = parseCommandLine({"/src", "/dst", "/LEV:1", "--no-empty-dirs", "/PURGE", "/XX", "/MOVE", "--include-hidden", "/LOG:log.txt"});

    EXPECT_FALSE(cfg.job.includeSubfolders);
    EXPECT_FALSE(cfg.job.includeEmptyFolders);
    EXPECT_TRUE(cfg.job.purge);
    EXPECT_TRUE(cfg.job.excludeExtra);
    EXPECT_TRUE(cfg.job.moveAll);
    EXPECT_FALSE(cfg.job.skipHidden);
    EXPECT_EQ(cfg.logFilePath, "log.txt");
    EXPECT_FALSE(cfg.logAppend);
}


TEST(ParseCommandLine, Help)
{
    EXPECT_TRUE(parseCommandLine({"-h"}).showHelp);
    EXPECT_TRUE(parseCommandLine({"--help"}).showHelp);
    EXPECT_TRUE(parseCommandLine({"/?"}).showHelp);
    EXPECT_FALSE(getSyntaxHelp().empty());
}


TEST(ParseCommandLine, SyntaxErrors)
{
    EXPECT_THROW(parseCommandLine({}), SysError);
    EXPECT_THROW(parseCommandLine({"/src"}), SysError);
    EXPECT_THROW(parseCommandLine({"/src", "/dst", "/extra"}), SysError);
    EXPECT_THROW(parseCommandLine({"/src", "/dst", "/R:x"}), SysError);
    EXPECT_THROW(parseCommandLine({"/src", "/dst", "/MT:"}), SysError);
    EXPECT_THROW(parseCommandLine({"/src", "/dst", "/COPY:DZ"}), SysError);
    EXPECT_THROW(parseCommandLine({"/src", "/dst", "/XF"}), SysError);
    EXPECT_THROW(parseCommandLine({"/src", "/dst", "/LEV:2"}), SysError);
    EXPECT_THROW(parseCommandLine({"/src", "/dst", "/LOG:"}), SysError);
    EXPECT_THROW(parseCommandLine({"/src", "/dst", "--unknown"}), SysError);
}
