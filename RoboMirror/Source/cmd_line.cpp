// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#include "cmd_line.h"
#include <algorithm>
#include <limits>

using namespace rbm;
using namespace robo;


namespace
{
//digits only, overflow checked
uint64_t parseUnsigned(const Zstring& str) //throw SysError
{
    if (str.empty() || !std::all_of(str.begin(), str.end(), [](char c) { return isDigit(c); }))
        throw SysError(replaceCpy(_("Invalid number: %x"), L"%x", fmtPath(str)));

    uint64_t number = 0;
    for (const char c : str)
    {
        const unsigned int digit = c - '0';
        if (number > (std::numeric_limits<uint64_t>::max() - digit) / 10)
            throw SysError(replaceCpy(_("Number is too large: %x"), L"%x", fmtPath(str)));
        number = number * 10 + digit;
    }
    return number;
}


int parseCount(const Zstring& str) //throw SysError
{
    const uint64_t number = parseUnsigned(str); //throw SysError
    if (number > static_cast<uint64_t>(std::numeric_limits<int>::max()))
        throw SysError(replaceCpy(_("Number is too large: %x"), L"%x", fmtPath(str)));
    return static_cast<int>(number);
}


//"/R:3" => "3"
bool parseOptionWithValue(const Zstring& arg, const Zchar* optionPrefix, Zstring& value)
{
    const std::string_view prefix = optionPrefix;
    if (arg.size() < prefix.size() || !equalAsciiNoCase(std::string_view(arg).substr(0, prefix.size()), prefix))
        return false;

    value = arg.substr(prefix.size());
    return true;
}


const Zchar* const optionsWithValue[] =
{
    Zstr("/LEV:"),
    Zstr("/R:"),
    Zstr("/W:"),
    Zstr("/MT:"),
    Zstr("/MIN:"),
    Zstr("/MAX:"),
    Zstr("/COPY:"),
    Zstr("/LOG:"),
    Zstr("/LOG+:"),
};

const Zchar* const optionsPlain[] =
{
    Zstr("/S"),
    Zstr("/E"),
    Zstr("/MIR"),
    Zstr("/PURGE"),
    Zstr("/XO"),
    Zstr("/XX"),
    Zstr("/IS"),
    Zstr("/MT"),
    Zstr("/Z"),
    Zstr("/IF"),
    Zstr("/XF"),
    Zstr("/XD"),
    Zstr("/MOV"),
    Zstr("/MOVE"),
    Zstr("/L"),
    Zstr("/V"),
    Zstr("/Q"),
    Zstr("--no-recurse"),
    Zstr("--no-empty-dirs"),
    Zstr("--no-resume"),
    Zstr("--include-hidden"),
};


bool isHelpRequest(const Zstring& arg)
{
    auto it = std::find_if(arg.begin(), arg.end(), [](Zchar c) { return c != Zstr('/') && c != Zstr('-'); });
    if (it == arg.begin()) return false; //require at least one prefix character

    const Zstring argTmp(it, arg.end());
    return equalAsciiNoCase(argTmp, Zstr("help")) ||
           equalAsciiNoCase(argTmp, Zstr("h"))    ||
           argTmp == Zstr("?");
}


bool isCommandLineOption(const Zstring& arg)
{
    Zstring dummy;
    return std::any_of(std::begin(optionsPlain), std::end(optionsPlain), [&](const Zchar* opt) { return equalAsciiNoCase(arg, opt); }) ||
           std::any_of(std::begin(optionsWithValue), std::end(optionsWithValue), [&](const Zchar* opt) { return parseOptionWithValue(arg, opt, dummy); }) ||
           isHelpRequest(arg);
}
}


uint64_t robo::parseFileSize(const Zstring& str) //throw SysError
{
    const Zstring sizeTrm = trimCpy(str);
    if (sizeTrm.empty())
        throw SysError(_("File size is missing."));

    uint64_t unit = 1;
    Zstring number = sizeTrm;
    switch (asciiToUpper(sizeTrm.back()))
    {
        //*INDENT-OFF*
        case 'K': unit = 1024ULL;                      break;
        case 'M': unit = 1024ULL * 1024;               break;
        case 'G': unit = 1024ULL * 1024 * 1024;        break;
        case 'T': unit = 1024ULL * 1024 * 1024 * 1024; break;
        //*INDENT-ON*
    }
    if (unit != 1)
        number.pop_back();

    try
    {
        const uint64_t value = parseUnsigned(number); //throw SysError
        if (value > std::numeric_limits<uint64_t>::max() / unit)
            throw SysError(L"Overflow.");
        return value * unit;
    }
    catch (const SysError&) { throw SysError(replaceCpy(_("Invalid file size: %x"), L"%x", fmtPath(str))); }
}


CommandLineConfig robo::parseCommandLine(const std::vector<Zstring>& args) //throw SysError
{
    CommandLineConfig cfg;
    std::vector<Zstring> positionalArgs;

    //"/IF *.txt *.doc": patterns up to the next option
    auto parsePatternList = [&](auto& it, std::vector<Zstring>& patterns, const Zstring& option)
    {
        const size_t countOld = patterns.size();
        while (std::next(it) != args.end() && !isCommandLineOption(*std::next(it)))
            patterns.push_back(*++it);

        if (patterns.size() == countOld)
            throw SysError(replaceCpy(_("At least one pattern is expected after %x."), L"%x", utfTo<std::wstring>(option)));
    };

    auto setLogFile = [&](const Zstring& option, const Zstring& filePath, bool append)
    {
        if (filePath.empty())
            throw SysError(replaceCpy(_("A file path is expected after %x."), L"%x", utfTo<std::wstring>(option)));
        cfg.logFilePath = filePath;
        cfg.logAppend = append;
    };

    for (auto it = args.begin(); it != args.end(); ++it)
    {
        const Zstring& arg = *it;
        Zstring value;

        if (isHelpRequest(arg))
            cfg.showHelp = true;
        else if (equalAsciiNoCase(arg, Zstr("/S")))
            cfg.job.includeSubfolders = true;
        else if (equalAsciiNoCase(arg, Zstr("--no-recurse")))
            cfg.job.includeSubfolders = false;
        else if (parseOptionWithValue(arg, Zstr("/LEV:"), value))
        {
            if (parseCount(value) != 1) //throw SysError
                throw SysError(replaceCpy(_("Unsupported depth level: %x"), L"%x", fmtPath(value)) + L' ' + _("Only /LEV:1 is supported."));
            cfg.job.includeSubfolders = false;
        }
        else if (equalAsciiNoCase(arg, Zstr("/E")))
            cfg.job.includeEmptyFolders = true;
        else if (equalAsciiNoCase(arg, Zstr("--no-empty-dirs")))
            cfg.job.includeEmptyFolders = false;
        else if (equalAsciiNoCase(arg, Zstr("/MIR")))
            cfg.job.mirror = true;
        else if (equalAsciiNoCase(arg, Zstr("/PURGE")))
            cfg.job.purge = true;
        else if (equalAsciiNoCase(arg, Zstr("/XO")))
            cfg.job.excludeOlder = true;
        else if (equalAsciiNoCase(arg, Zstr("/XX")))
            cfg.job.excludeExtra = true;
        else if (equalAsciiNoCase(arg, Zstr("/IS")))
            cfg.job.includeSame = true;
        else if (parseOptionWithValue(arg, Zstr("/R:"), value))
            cfg.job.retryCount = parseCount(value); //throw SysError
        else if (parseOptionWithValue(arg, Zstr("/W:"), value))
            cfg.job.retryWait = std::chrono::seconds(parseCount(value)); //throw SysError
        else if (equalAsciiNoCase(arg, Zstr("/MT")))
            cfg.job.threadCount = JobConfig().threadCount;
        else if (parseOptionWithValue(arg, Zstr("/MT:"), value))
            cfg.job.threadCount = parseCount(value); //throw SysError
        else if (equalAsciiNoCase(arg, Zstr("/Z")))
            cfg.job.resumePartial = true;
        else if (equalAsciiNoCase(arg, Zstr("--no-resume")))
            cfg.job.resumePartial = false;
        else if (equalAsciiNoCase(arg, Zstr("/IF")))
            parsePatternList(it, cfg.job.includeFiles, arg); //throw SysError
        else if (equalAsciiNoCase(arg, Zstr("/XF")))
            parsePatternList(it, cfg.job.excludeFiles, arg); //throw SysError
        else if (equalAsciiNoCase(arg, Zstr("/XD")))
            parsePatternList(it, cfg.job.excludeFolders, arg); //throw SysError
        else if (parseOptionWithValue(arg, Zstr("/MIN:"), value))
            cfg.job.minFileSize = parseFileSize(value); //throw SysError
        else if (parseOptionWithValue(arg, Zstr("/MAX:"), value))
            cfg.job.maxFileSize = parseFileSize(value); //throw SysError
        else if (parseOptionWithValue(arg, Zstr("/COPY:"), value))
        {
            cfg.job.copyPermissions = false;
            cfg.job.copyTimestamps  = false;
            cfg.job.copyXattr       = false;

            for (const char c : value)
                switch (asciiToUpper(c))
                {
                    //*INDENT-OFF*
                    case 'D': break; //data is always copied
                    case 'A': cfg.job.copyPermissions = true; break;
                    case 'T': cfg.job.copyTimestamps  = true; break;
                    case 'X': cfg.job.copyXattr       = true; break;
                    default:
                        throw SysError(replaceCpy(_("Invalid copy flag %x."), L"%x", fmtPath(Zstring(1, c))) + L' ' + _("Supported flags: D, A, T, X"));
                    //*INDENT-ON*
                }
        }
        else if (equalAsciiNoCase(arg, Zstr("/MOV")))
            cfg.job.moveFiles = true;
        else if (equalAsciiNoCase(arg, Zstr("/MOVE")))
            cfg.job.moveAll = true;
        else if (equalAsciiNoCase(arg, Zstr("/L")))
            cfg.job.dryRun = true;
        else if (equalAsciiNoCase(arg, Zstr("/V")))
            cfg.verbosity = Verbosity::verbose;
        else if (equalAsciiNoCase(arg, Zstr("/Q")))
            cfg.verbosity = Verbosity::quiet;
        else if (parseOptionWithValue(arg, Zstr("/LOG:"), value))
            setLogFile(arg, value, false /*append*/); //throw SysError
        else if (parseOptionWithValue(arg, Zstr("/LOG+:"), value))
            setLogFile(arg, value, true /*append*/); //throw SysError
        else if (equalAsciiNoCase(arg, Zstr("--include-hidden")))
            cfg.job.skipHidden = false;
        else if (startsWith(arg, Zstr("--")))
            throw SysError(replaceCpy(_("Unknown option %x."), L"%x", fmtPath(arg)));
        else
            positionalArgs.push_back(arg);
    }

    if (cfg.showHelp)
        return cfg;

    if (positionalArgs.size() < 2)
        throw SysError(_("A source and a target folder path are expected."));
    if (positionalArgs.size() > 2)
        throw SysError(replaceCpy(_("Unexpected argument %x."), L"%x", fmtPath(positionalArgs[2])));

    cfg.job.sourcePath = positionalArgs[0];
    cfg.job.targetPath = positionalArgs[1];
    return cfg;
}


std::wstring robo::getSyntaxHelp()
{
    return _("Syntax:") + L"\n" +
           L"robomirror SOURCE TARGET [options]\n"
           L"\n" +
           _("Folder options:") + L"\n"
           L"    /S                  " + _("Include subfolders (default)") + L"\n"
           L"    /LEV:1, --no-recurse" + L" " + _("Top level files only") + L"\n"
           L"    /E                  " + _("Create empty folders at target (default)") + L"\n"
           L"    --no-empty-dirs     " + _("Create folders only for copied files") + L"\n"
           L"    /MIR                " + _("Mirror: copy and delete extra target items") + L"\n"
           L"    /PURGE              " + _("Delete extra target items") + L"\n"
           L"    --include-hidden    " + _("Include items whose name starts with a dot") + L"\n"
           L"\n" +
           _("Comparison:") + L"\n"
           L"    /XO                 " + _("Exclude files that are not newer than the target") + L"\n"
           L"    /XX                 " + _("Never delete extra target items") + L"\n"
           L"    /IS                 " + _("Copy identical files, too") + L"\n"
           L"\n" +
           _("Filter:") + L"\n"
           L"    /IF pattern...      " + _("Include files matching a pattern") + L"\n"
           L"    /XF pattern...      " + _("Exclude files matching a pattern") + L"\n"
           L"    /XD pattern...      " + _("Exclude folders matching a pattern") + L"\n"
           L"    /MIN:size /MAX:size " + _("File size range, for example 10K, 2G") + L"\n"
           L"\n" +
           _("Copy options:") + L"\n"
           L"    /COPY:DATX          " + _("D=data, A=permissions, T=timestamps, X=extended attributes") + L"\n"
           L"    /R:n /W:n           " + _("Retry count (default 3) and wait in seconds (default 5)") + L"\n"
           L"    /MT:n               " + _("Parallel file copies (default 8)") + L"\n"
           L"    /Z, --no-resume     " + _("Resume interrupted copies (default) or restart them") + L"\n"
           L"    /MOV                " + _("Delete source files after copying") + L"\n"
           L"    /MOVE               " + _("Delete source files and folders after copying") + L"\n"
           L"    /L                  " + _("List only: do not change anything") + L"\n"
           L"\n" +
           _("Logging:") + L"\n"
           L"    /V                  " + _("Verbose output") + L"\n"
           L"    /Q                  " + _("Errors only") + L"\n"
           L"    /LOG:file           " + _("Write log file (replace)") + L"\n"
           L"    /LOG+:file          " + _("Write log file (append)") + L"\n"
           L"    -h, --help          " + _("Show this help") + L"\n";
}
