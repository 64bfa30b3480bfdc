// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#include "native.h"
#include <rbm/file_traverser.h>

using namespace rbm;
using namespace robo;


namespace
{
struct InputStreamNative : public AFS::InputStream
{
    InputStreamNative(const Zstring& filePath, uint64_t offset) : fileIn_(filePath) //throw FileError, ErrorFileLocked, ErrorPermissionDenied
    {
        if (offset > 0)
            fileIn_.seek(offset); //throw FileError
    }

    size_t getBlockSize() override { return fileIn_.getBlockSize(); } //throw FileError

    size_t tryRead(void* buffer, size_t bytesToRead) override { return fileIn_.tryRead(buffer, bytesToRead); } //throw FileError, ErrorFileLocked

private:
    FileInputPlain fileIn_;
};


struct OutputStreamNative : public AFS::OutputStream
{
    OutputStreamNative(const Zstring& filePath, FileOutputMode mode) : fileOut_(filePath, mode) {} //throw FileError, ErrorTargetExisting, ErrorPermissionDenied

    void write(const void* buffer, size_t bytesToWrite) override { fileOut_.write(buffer, bytesToWrite); } //throw FileError

    void finalize() override //throw FileError
    {
        fileOut_.flushToDisk(); //throw FileError
        fileOut_.close();       //
    }

private:
    FileOutputPlain fileOut_;
};
}


std::optional<AFS::ItemDetails> NativeFileSystem::getItemDetailsIfExists(const Zstring& itemPath) const //throw FileError
{
    return rbm::getItemDetailsIfExists(itemPath); //throw FileError
}


Zstring NativeFileSystem::getResolvedPath(const Zstring& itemPath) const //throw FileError
{
    return getResolvedFilePath(itemPath); //throw FileError
}


std::unique_ptr<AFS::InputStream> NativeFileSystem::getInputStream(const Zstring& filePath, uint64_t offset) const
{
    return std::make_unique<InputStreamNative>(filePath, offset); //throw FileError, ErrorFileLocked, ErrorPermissionDenied
}


std::unique_ptr<AFS::OutputStream> NativeFileSystem::getOutputStream(const Zstring& filePath, FileOutputMode mode) const
{
    return std::make_unique<OutputStreamNative>(filePath, mode); //throw FileError, ErrorTargetExisting, ErrorPermissionDenied
}


uint64_t NativeFileSystem::copyNewFile(const Zstring& sourcePath, const Zstring& targetPath, const IoCallback& notifyUnbufferedIO) const
{
    return rbm::copyNewFile(sourcePath, targetPath, notifyUnbufferedIO).fileSize; //throw FileError, ErrorTargetExisting, ErrorFileLocked, X
}


void NativeFileSystem::moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo) const //throw FileError, ErrorMoveUnsupported
{
    rbm::moveAndRenameItem(pathFrom, pathTo, true /*replaceExisting*/); //throw FileError, ErrorMoveUnsupported
}


void NativeFileSystem::removeFilePlain      (const Zstring& filePath  ) const { rbm::removeFilePlain   (filePath);   } //
void NativeFileSystem::removeSymlinkPlain   (const Zstring& linkPath  ) const { rbm::removeSymlinkPlain(linkPath);   } //throw FileError
void NativeFileSystem::removeFolderPlain    (const Zstring& folderPath) const { removeDirectoryPlain(folderPath);     } //
void NativeFileSystem::removeFolderRecursion(const Zstring& folderPath) const { removeDirectoryPlainRecursion(folderPath); } //


std::vector<Zstring> NativeFileSystem::createFolderIfMissingRecursion(const Zstring& folderPath) const //throw FileError
{
    return createDirectoryIfMissingRecursion(folderPath); //throw FileError
}


void NativeFileSystem::copyFileTimes(const Zstring& sourcePath, const Zstring& targetPath) const //throw FileError
{
    struct stat sourceInfo = {};
    if (::stat(sourcePath.c_str(), &sourceInfo) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(sourcePath)), "stat");

    setFileTimes(targetPath, sourceInfo.st_atim, sourceInfo.st_mtim); //throw FileError
}


void NativeFileSystem::copyPermissions(const Zstring& sourcePath, const Zstring& targetPath) const //throw FileError
{
    copyItemPermissions(sourcePath, targetPath); //throw FileError
}


void NativeFileSystem::copyExtendedAttributes(const Zstring& sourcePath, const Zstring& targetPath) const //throw FileError
{
    rbm::copyExtendedAttributes(sourcePath, targetPath); //throw FileError
}


void NativeFileSystem::traverseFolder(const Zstring& folderPath, //throw FileError
                                      const std::function<void(const FileInfo&    fi)>& onFile,
                                      const std::function<void(const FolderInfo&  fi)>& onFolder,
                                      const std::function<void(const SymlinkInfo& si)>& onSymlink) const
{
    rbm::traverseFolder(folderPath,
    [&](const rbm::FileInfo& fi)
    {
        if (onFile)
            onFile({fi.itemName, fi.fileSize, fi.modTime, fi.isRegular});
    },
    [&](const rbm::FolderInfo& fi)
    {
        if (onFolder)
            onFolder({fi.itemName});
    },
    [&](const rbm::SymlinkInfo& si)
    {
        if (onSymlink)
            onSymlink({si.itemName});
    }); //throw FileError
}
