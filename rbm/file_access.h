// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef FILE_ACCESS_H_4019283746501928
#define FILE_ACCESS_H_4019283746501928

#include <functional>
#include <optional>
#include <vector>
#include <sys/stat.h>
#include "file_path.h"
#include "file_error.h"


namespace rbm
{
//report number of bytes processed since last call
using IoCallback = std::function<void(int64_t bytesDelta)>;

enum class ItemType
{
    file,
    folder,
    symlink,
};

struct ItemDetails
{
    ItemType type = ItemType::file;
    uint64_t fileSize = 0;
    timespec modTime = {};
    timespec accessTime = {};
    mode_t mode = 0;
};

//symlink handling: do not follow
ItemType getItemType(const Zstring& itemPath); //throw FileError

//not existing: ENOENT, ENOTDIR
std::optional<ItemDetails> getItemDetailsIfExists(const Zstring& itemPath); //throw FileError
inline std::optional<ItemType> getItemTypeIfExists(const Zstring& itemPath) //throw FileError
{
    if (const std::optional<ItemDetails> details = getItemDetailsIfExists(itemPath)) //throw FileError
        return details->type;
    return std::nullopt;
}
inline bool itemExists(const Zstring& itemPath) { return static_cast<bool>(getItemTypeIfExists(itemPath)); } //throw FileError

//absolute path with all symlinks resolved
Zstring getResolvedFilePath(const Zstring& itemPath); //throw FileError

void removeFilePlain     (const Zstring& filePath);         //throw FileError; ERROR if not existing
void removeSymlinkPlain  (const Zstring& linkPath);         //throw FileError; ERROR if not existing
void removeDirectoryPlain(const Zstring& dirPath );         //throw FileError; ERROR if not existing
void removeDirectoryPlainRecursion(const Zstring& dirPath); //throw FileError; ERROR if not existing

//rename() is atomic and replaces an existing file
void moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo, bool replaceExisting); //throw FileError, ErrorMoveUnsupported, ErrorTargetExisting

//symlink handling: follow
void setFileTimes(const Zstring& filePath, const timespec& accessTime, const timespec& modTime); //throw FileError

//POSIX permission bits only: changing ownership requires admin rights
void copyItemPermissions(const Zstring& sourcePath, const Zstring& targetPath); //throw FileError

//"user." namespace only: other namespaces are privileged ("trusted.", "security.") or owned by copyItemPermissions() ("system.posix_acl_*")
void copyExtendedAttributes(const Zstring& sourcePath, const Zstring& targetPath); //throw FileError

void createDirectory(const Zstring& dirPath); //throw FileError, ErrorTargetExisting

//creates directories recursively if not existing; returns the folders created, parents first
std::vector<Zstring> createDirectoryIfMissingRecursion(const Zstring& dirPath); //throw FileError

struct FileCopyResult
{
    uint64_t fileSize = 0;
};

//create *new* target file: ErrorTargetExisting if existing; data only, no attributes
FileCopyResult copyNewFile(const Zstring& sourceFile, const Zstring& targetFile, //throw FileError, ErrorTargetExisting, ErrorFileLocked, ErrorPermissionDenied, X
                           const IoCallback& notifyUnbufferedIO /*throw X*/);
}

#endif //FILE_ACCESS_H_4019283746501928
