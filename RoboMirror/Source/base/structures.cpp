// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#include "structures.h"

using namespace rbm;
using namespace robo;


void robo::validateConfig(const JobConfig& cfg, const AbstractFileSystem& afs) //throw ErrorSourceNotFound, ErrorSourceNotFolder, ErrorInvalidThreadCount, ErrorInvalidRetryCount, FileError
{
    if (cfg.threadCount < 1)
        throw ErrorInvalidThreadCount(replaceCpy(_("Invalid number of parallel file operations: %x"), L"%x", numberTo<std::wstring>(cfg.threadCount)),
                                      _("At least one file operation is required."));

    if (cfg.retryCount < 0)
        throw ErrorInvalidRetryCount(replaceCpy(_("Invalid number of retries: %x"), L"%x", numberTo<std::wstring>(cfg.retryCount)));

    if (cfg.deleteRetryCount < 0)
        throw ErrorInvalidRetryCount(replaceCpy(_("Invalid number of retries: %x"), L"%x", numberTo<std::wstring>(cfg.deleteRetryCount)));

    if (cfg.sourcePath.empty())
        throw ErrorSourceNotFound(_("Source folder path is missing."));

    if (cfg.targetPath.empty())
        throw ErrorTargetCreation(_("Target folder path is missing."));

    const std::optional<AFS::ItemType> sourceType = afs.getItemTypeIfExists(cfg.sourcePath); //throw FileError
    if (!sourceType)
        throw ErrorSourceNotFound(replaceCpy(_("Cannot find folder %x."), L"%x", fmtPath(cfg.sourcePath)));

    //follow symlinks: the source root may be a link to a folder
    if (*sourceType == AFS::ItemType::file ||
        (*sourceType == AFS::ItemType::symlink && afs.getItemTypeIfExists(afs.getResolvedPath(cfg.sourcePath)) != AFS::ItemType::folder)) //throw FileError
        throw ErrorSourceNotFolder(replaceCpy(_("Source path %x is not a folder."), L"%x", fmtPath(cfg.sourcePath)));

    if (cfg.minFileSize && cfg.maxFileSize && *cfg.minFileSize > *cfg.maxFileSize)
        throw FileError(replaceCpy(replaceCpy(_("Invalid file size range: %x > %y"), L"%x", numberTo<std::wstring>(*cfg.minFileSize)),
                                   L"%y", numberTo<std::wstring>(*cfg.maxFileSize)));
}


std::wstring robo::getSkipReasonLabel(SkipReason reason)
{
    switch (reason)
    {
        //*INDENT-OFF*
        case SkipReason::identical:        return _("identical");
        case SkipReason::newerAtTarget:    return _("newer at target");
        case SkipReason::excludedByFilter: return _("excluded by filter");
        case SkipReason::sizeOutOfRange:   return _("size out of range");
        case SkipReason::dryRun:           return _("dry run");
        //*INDENT-ON*
    }
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}
