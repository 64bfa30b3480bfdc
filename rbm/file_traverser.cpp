// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#include "file_traverser.h"
#include "file_path.h"
#include <fcntl.h>    //open, AT_SYMLINK_NOFOLLOW
#include <unistd.h>   //close
#include <sys/stat.h>
#include <dirent.h>

using namespace rbm;


namespace
{
bool isDotOrDotDot(const char* name)
{
    return name[0] == '.' && (name[1] == '\0' || (name[1] == '.' && name[2] == '\0'));
}
}


void rbm::traverseFolder(const Zstring& dirPath,
                         const std::function<void(const FileInfo&    fi)>& onFile,
                         const std::function<void(const FolderInfo&  fi)>& onFolder,
                         const std::function<void(const SymlinkInfo& si)>& onSymlink) //throw FileError
{
    const std::wstring errorMsg = replaceCpy(_("Cannot read directory %x."), L"%x", fmtPath(dirPath));

    //stat relative to the directory handle: no repeated path resolution per item
    const int fdDir = ::open(dirPath.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fdDir == -1)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot open directory %x."), L"%x", fmtPath(dirPath)), "open(O_DIRECTORY)");

    DIR* folder = ::fdopendir(fdDir); //takes ownership of fdDir on success only
    if (!folder)
    {
        const int ec = errno; //copy before making other system calls!
        ::close(fdDir);
        throw FileError(replaceCpy(_("Cannot open directory %x."), L"%x", fmtPath(dirPath)), formatSystemError("fdopendir", ec));
    }
    RBM_ON_SCOPE_EXIT(::closedir(folder)); //also closes fdDir

    for (;;)
    {
        errno = 0;
        const dirent* dirEntry = ::readdir(folder);
        if (!dirEntry)
        {
            if (errno != 0)
                THROW_LAST_FILE_ERROR(errorMsg, "readdir");
            return; //end of stream
        }

        const char* itemNameRaw = dirEntry->d_name;
        if (isDotOrDotDot(itemNameRaw))
            continue;

        if (itemNameRaw[0] == '\0')
            throw FileError(errorMsg, formatSystemError("readdir", L"", L"Folder contains an item without name."));

        const Zstring itemName = itemNameRaw;
        const Zstring itemPath = appendPath(dirPath, itemName);

        struct stat statData = {};
        if (::fstatat(fdDir, itemNameRaw, &statData, AT_SYMLINK_NOFOLLOW) != 0)
            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), "fstatat");

        //Linux: no distinction between file and folder symlinks
        if (S_ISLNK(statData.st_mode))
        {
            if (onSymlink) onSymlink({itemName, itemPath});
        }
        else if (S_ISDIR(statData.st_mode))
        {
            if (onFolder) onFolder({itemName, itemPath});
        }
        else if (onFile) //regular file, or named pipe, device, socket: never opened here
            onFile({itemName, itemPath, static_cast<uint64_t>(statData.st_size), statData.st_mtim, S_ISREG(statData.st_mode) != 0});
    }
}
