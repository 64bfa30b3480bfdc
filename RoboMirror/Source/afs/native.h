// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef NATIVE_H_5501928374651029
#define NATIVE_H_5501928374651029

#include "abstract.h"


namespace robo
{
//local POSIX file system
class NativeFileSystem : public AbstractFileSystem
{
public:
    std::optional<ItemDetails> getItemDetailsIfExists(const Zstring& itemPath) const override; //throw FileError
    Zstring getResolvedPath(const Zstring& itemPath) const override; //throw FileError

    std::unique_ptr<InputStream> getInputStream(const Zstring& filePath, uint64_t offset) const override; //throw FileError, ErrorFileLocked, ErrorPermissionDenied
    std::unique_ptr<OutputStream> getOutputStream(const Zstring& filePath, rbm::FileOutputMode mode) const override; //throw FileError, ErrorTargetExisting, ErrorPermissionDenied

    uint64_t copyNewFile(const Zstring& sourcePath, const Zstring& targetPath, //throw FileError, ErrorTargetExisting, ErrorFileLocked, X
                         const rbm::IoCallback& notifyUnbufferedIO /*throw X*/) const override;

    void moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo) const override; //throw FileError, ErrorMoveUnsupported

    void removeFilePlain      (const Zstring& filePath  ) const override; //
    void removeSymlinkPlain   (const Zstring& linkPath  ) const override; //throw FileError
    void removeFolderPlain    (const Zstring& folderPath) const override; //
    void removeFolderRecursion(const Zstring& folderPath) const override; //

    std::vector<Zstring> createFolderIfMissingRecursion(const Zstring& folderPath) const override; //throw FileError

    void copyFileTimes         (const Zstring& sourcePath, const Zstring& targetPath) const override; //
    void copyPermissions       (const Zstring& sourcePath, const Zstring& targetPath) const override; //throw FileError
    void copyExtendedAttributes(const Zstring& sourcePath, const Zstring& targetPath) const override; //

    void traverseFolder(const Zstring& folderPath, //throw FileError
                        const std::function<void(const FileInfo&    fi)>& onFile,
                        const std::function<void(const FolderInfo&  fi)>& onFolder,
                        const std::function<void(const SymlinkInfo& si)>& onSymlink) const override;
};
}

#endif //NATIVE_H_5501928374651029
