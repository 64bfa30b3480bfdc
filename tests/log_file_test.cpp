// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#include <ctime>
#include <sstream>
#include <rbm/extra_log.h>
#include "test_utils.h"
#include "../RoboMirror/Source/console_status_handler.h"
#include "../RoboMirror/Source/log_file.h"

using namespace rbm;
using namespace robo;
using namespace robo::test;


class ConsoleStatusHandlerTest : public testing::Test
{
protected:
    void SetUp() override { fetchExtraLog(); } //prepareResult() merges the process-wide log
};


TEST_F(ConsoleStatusHandlerTest, OutcomeLines)
{
    std::ostringstream out;
    std::ostringstream err;
    ConsoleStatusHandler handler(Verbosity::normal, out, err);

    handler.reportOutcome(OutcomeCopied{"/src/dir/a.txt", "/dst/dir/a.txt", 10});
    handler.reportOutcome(OutcomeFolderCreated{"/dst/dir"});
    handler.reportOutcome(OutcomeDeleted{"/dst/old.txt", false});
    handler.reportOutcome(OutcomeSkipped{"/src/same.txt", SkipReason::identical, 5});
    handler.reportOutcome(OutcomeFailed{"/src/bad.txt", L"Cannot read file."});
    handler.logMessage(L"Cannot delete directory.", ProcessCallback::MsgType::warning);

    EXPECT_EQ(out.str(), "COPY: a.txt -> /dst/dir/a.txt (10 B)\n"
              "MKDIR: /dst/dir\n"
              "DELETE: /dst/old.txt\n"); //no skipped items in normal mode

    EXPECT_EQ(err.str(), "ERROR: /src/bad.txt: Cannot read file.\n"
              "WARNING: Cannot delete directory.\n");

    const ErrorLogStats stats = getStats(handler.getErrorLog());
    EXPECT_EQ(stats.info, 3);
    EXPECT_EQ(stats.warning, 1);
    EXPECT_EQ(stats.error, 1);

    EXPECT_EQ(handler.prepareResult().finalStatus, CopyResult::finishedError);
}


TEST_F(ConsoleStatusHandlerTest, VerbosityLevels)
{
    std::ostringstream outQuiet, errQuiet;
    ConsoleStatusHandler quiet(Verbosity::quiet, outQuiet, errQuiet);
    quiet.reportOutcome(OutcomeCopied{"/src/a", "/dst/a", 1});
    quiet.reportOutcome(OutcomeFailed{"/src/b", L"failed"});
    EXPECT_TRUE(outQuiet.str().empty());
    EXPECT_EQ(errQuiet.str(), "ERROR: /src/b: failed\n");

    std::ostringstream outVerbose, errVerbose;
    ConsoleStatusHandler verbose(Verbosity::verbose, outVerbose, errVerbose);
    verbose.reportOutcome(OutcomeSkipped{"/src/same.txt", SkipReason::identical, 5});
    EXPECT_EQ(outVerbose.str(), "SKIP: same.txt (identical)\n");
    EXPECT_EQ(verbose.prepareResult().finalStatus, CopyResult::finishedSuccess);
}


TEST_F(ConsoleStatusHandlerTest, FinalStatus)
{
    std::ostringstream out, err;

    ConsoleStatusHandler warning(Verbosity::normal, out, err);
    warning.logMessage(L"warning", ProcessCallback::MsgType::warning);
    EXPECT_EQ(warning.prepareResult().finalStatus, CopyResult::finishedWarning);

    ConsoleStatusHandler aborted(Verbosity::normal, out, err);
    aborted.reportFatalError(L"Cannot find folder.");
    EXPECT_EQ(aborted.prepareResult().finalStatus, CopyResult::aborted);
}


TEST(ReturnCodes, Mapping)
{
    EXPECT_EQ(mapToReturnCode(CopyResult::finishedSuccess), RBM_RC_SUCCESS);
    EXPECT_EQ(mapToReturnCode(CopyResult::finishedWarning), RBM_RC_WARNING);
    EXPECT_EQ(mapToReturnCode(CopyResult::finishedError),   RBM_RC_ERROR);
    EXPECT_EQ(mapToReturnCode(CopyResult::aborted),         RBM_RC_ABORTED);

    RoboReturnCode rc = RBM_RC_WARNING;
    raiseReturnCode(rc, RBM_RC_SUCCESS);
    EXPECT_EQ(rc, RBM_RC_WARNING);
    raiseReturnCode(rc, RBM_RC_ERROR);
    EXPECT_EQ(rc, RBM_RC_ERROR);
}


class LogFileTest : public TempDirTest {};


TEST_F(LogFileTest, ContainsHeaderEntriesAndSummary)
{
    ErrorLog log;
    logMsg(log, L"COPY: a.txt -> /dst/a.txt (1 B)", MSG_TYPE_INFO);
    logMsg(log, L"ERROR: /src/b.txt: Cannot read file.", MSG_TYPE_ERROR);

    RunResult result;
    result.record(OutcomeCopied{"/src/a.txt", "/dst/a.txt", 1});
    result.record(OutcomeFailed{"/src/b.txt", L"Cannot read file."});
    result.finish();

    const LogSummary summary{"/src", "/dst", result.getStartTime(), CopyResult::finishedError};
    const Zstring logFilePath = appendPath(rootDir_, "run.log");
    saveLogFile(logFilePath, false /*append*/, summary, log, &result);

    const std::string content = readFile(logFilePath);
    EXPECT_TRUE(contains(content, "|    Completed with errors\n"));
    EXPECT_TRUE(contains(content, "|    Errors: 1\n"));
    EXPECT_TRUE(contains(content, "|    Source: \"/src\"\n"));
    EXPECT_TRUE(contains(content, "|    Target: \"/dst\"\n"));
    EXPECT_TRUE(contains(content, "]  Info:  COPY: a.txt -> /dst/a.txt (1 B)\n"));
    EXPECT_TRUE(contains(content, "]  Error:  ERROR: /src/b.txt: Cannot read file.\n"));
    EXPECT_TRUE(contains(content, utfTo<std::string>(result.formatSummary())));
    EXPECT_EQ(content, generateLogText(summary, log, &result));
}


TEST_F(LogFileTest, AppendKeepsExistingContent)
{
    const Zstring logFilePath = appendPath(rootDir_, "append.log");
    writeFile(logFilePath, "previous run");

    ErrorLog log;
    logMsg(log, L"second run", MSG_TYPE_INFO);
    const LogSummary summary{"/src", "/dst", std::time(nullptr), CopyResult::finishedSuccess};

    saveLogFile(logFilePath, true /*append*/, summary, log, nullptr);
    const std::string content = readFile(logFilePath);
    EXPECT_TRUE(content.starts_with("previous run\n\n"));
    EXPECT_TRUE(contains(content, "second run"));

    saveLogFile(logFilePath, false /*append*/, summary, log, nullptr);
    EXPECT_FALSE(contains(readFile(logFilePath), "previous run"));
}
