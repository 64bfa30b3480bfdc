// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef ABSTRACT_H_1820394756102938
#define ABSTRACT_H_1820394756102938

#include <ctime>
#include <functional>
#include <memory>
#include <rbm/file_error.h>
#include <rbm/file_access.h>
#include <rbm/file_io.h>


namespace robo
{
//file system capabilities consumed by the copy engine
//THREAD-SAFETY: "const" member functions must model thread-safe access!
struct AbstractFileSystem
{
    virtual ~AbstractFileSystem() {}

    using ItemType    = rbm::ItemType;
    using ItemDetails = rbm::ItemDetails;

    //symlink handling: do not follow
    virtual std::optional<ItemDetails> getItemDetailsIfExists(const Zstring& itemPath) const = 0; //throw FileError

    std::optional<ItemType> getItemTypeIfExists(const Zstring& itemPath) const //throw FileError
    {
        if (const std::optional<ItemDetails> details = getItemDetailsIfExists(itemPath)) //throw FileError
            return details->type;
        return std::nullopt;
    }

    //absolute path, symlinks resolved
    virtual Zstring getResolvedPath(const Zstring& itemPath) const = 0; //throw FileError
    //----------------------------------------------------------------------------------------------------------------

    struct InputStream
    {
        virtual ~InputStream() {}
        virtual size_t getBlockSize() = 0; //throw FileError; non-zero block size is AFS contract!
        virtual size_t tryRead(void* buffer, size_t bytesToRead) = 0; //throw FileError, ErrorFileLocked
        //may return short; only 0 means EOF! CONTRACT: bytesToRead > 0!
    };
    //return value always bound; reading starts at "offset"
    virtual std::unique_ptr<InputStream> getInputStream(const Zstring& filePath, uint64_t offset) const = 0; //throw FileError, ErrorFileLocked, ErrorPermissionDenied

    struct OutputStream
    {
        virtual ~OutputStream() {}
        virtual void write(const void* buffer, size_t bytesToWrite) = 0; //throw FileError
        virtual void finalize() = 0; //throw FileError; flush to disk + close
    };
    //FileOutputMode::appendResumable: data written so far survives a failed transfer
    virtual std::unique_ptr<OutputStream> getOutputStream(const Zstring& filePath, rbm::FileOutputMode mode) const = 0; //throw FileError, ErrorTargetExisting, ErrorPermissionDenied

    //already existing: fail; data only
    virtual uint64_t copyNewFile(const Zstring& sourcePath, const Zstring& targetPath, //throw FileError, ErrorTargetExisting, ErrorFileLocked, X
                                 const rbm::IoCallback& notifyUnbufferedIO /*throw X*/) const = 0;
    //----------------------------------------------------------------------------------------------------------------

    //atomic; replaces an existing file
    virtual void moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo) const = 0; //throw FileError, ErrorMoveUnsupported

    virtual void removeFilePlain      (const Zstring& filePath  ) const = 0; //
    virtual void removeSymlinkPlain   (const Zstring& linkPath  ) const = 0; //throw FileError
    virtual void removeFolderPlain    (const Zstring& folderPath) const = 0; //
    virtual void removeFolderRecursion(const Zstring& folderPath) const = 0; //

    //returns the folders that had to be created, parents first
    virtual std::vector<Zstring> createFolderIfMissingRecursion(const Zstring& folderPath) const = 0; //throw FileError
    //----------------------------------------------------------------------------------------------------------------

    //symlink handling: follow
    virtual void copyFileTimes         (const Zstring& sourcePath, const Zstring& targetPath) const = 0; //
    virtual void copyPermissions       (const Zstring& sourcePath, const Zstring& targetPath) const = 0; //throw FileError
    virtual void copyExtendedAttributes(const Zstring& sourcePath, const Zstring& targetPath) const = 0; //
    //----------------------------------------------------------------------------------------------------------------

    struct FileInfo
    {
        Zstring itemName;
        uint64_t fileSize = 0; //unit: bytes!
        timespec modTime = {};
        bool isRegular = true; //false: named pipe, device, socket
    };

    struct FolderInfo
    {
        Zstring itemName;
    };

    struct SymlinkInfo
    {
        Zstring itemName;
    };

    //non-recursive; symlinks are reported, not followed
    virtual void traverseFolder(const Zstring& folderPath, //throw FileError
                                const std::function<void(const FileInfo&    fi)>& onFile,    //
                                const std::function<void(const FolderInfo&  fi)>& onFolder,  //optional
                                const std::function<void(const SymlinkInfo& si)>& onSymlink) const = 0; //

    enum class TraverseControl
    {
        descend,
        skipSubtree,
    };

    //relPath: relative to the base folder of the traversal, no leading/trailing separator
    struct TraverserCallback
    {
        virtual ~TraverserCallback() {}

        virtual void            onFile   (const FileInfo&    fi, const Zstring& relPath) = 0; //
        virtual TraverseControl onFolder (const FolderInfo&  fi, const Zstring& relPath) = 0; //throw X
        virtual void            onSymlink(const SymlinkInfo& si, const Zstring& relPath) = 0; //

        //failed to read a sub folder: its content is missing from the traversal
        virtual void reportDirError(const rbm::FileError& e, const Zstring& relPath) = 0; //throw X
    };

    //depth-first; the base folder must be readable
    void traverseFolderRecursive(const Zstring& baseFolderPath, TraverserCallback& cb) const; //throw FileError, X
};

using AFS = AbstractFileSystem;
}

#endif //ABSTRACT_H_1820394756102938
