// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef FILE_IO_H_3019283745610293
#define FILE_IO_H_3019283745610293

#include "file_access.h"


namespace rbm
{
const char LINE_BREAK[] = "\n";

/*  OS-buffered file I/O:
    - sequential read/write accesses
    - better error reporting
    - follows symlinks                     */
class FileBase
{
public:
    using FileHandle = int;
    static const int invalidFileHandle = -1;

    FileHandle getHandle() { return hFile_; }

    const Zstring& getFilePath() const { return filePath_; }

    size_t getBlockSize(); //throw FileError
    static constexpr size_t defaultBlockSize = 256 * 1024;

    void close(); //throw FileError -> good place to catch errors when closing stream, otherwise called in ~FileBase()!

    const struct stat& getStatBuffered(); //throw FileError

protected:
    FileBase(FileHandle handle, const Zstring& filePath) : hFile_(handle), filePath_(filePath) {}
    ~FileBase();

    void setStatBuffered(const struct stat& fileInfo) { statBuf_ = fileInfo; }

private:
    FileBase           (const FileBase&) = delete;
    FileBase& operator=(const FileBase&) = delete;

    FileHandle hFile_ = invalidFileHandle;
    const Zstring filePath_;
    size_t blockSizeBuf_ = 0;
    std::optional<struct stat> statBuf_;
};

//-----------------------------------------------------------------------------------------------

class FileInputPlain : public FileBase
{
public:
    FileInputPlain(                   const Zstring& filePath); //throw FileError, ErrorFileLocked, ErrorPermissionDenied
    FileInputPlain(FileHandle handle, const Zstring& filePath); //takes ownership!

    //position for the next tryRead()
    void seek(uint64_t offset); //throw FileError

    //may return short, only 0 means EOF! CONTRACT: bytesToRead > 0!
    size_t tryRead(void* buffer, size_t bytesToRead); //throw FileError, ErrorFileLocked

private:
    FileInputPlain(const std::pair<FileBase::FileHandle, struct stat>& fileDetails, const Zstring& filePath);
};


enum class FileOutputMode
{
    createNew,       //ErrorTargetExisting if existing; file is deleted again unless close()d
    appendResumable, //create if missing, otherwise append; file is kept as is if not close()d
};

class FileOutputPlain : public FileBase
{
public:
    FileOutputPlain(const Zstring& filePath, FileOutputMode mode = FileOutputMode::createNew); //throw FileError, ErrorTargetExisting, ErrorPermissionDenied
    FileOutputPlain(FileHandle handle, const Zstring& filePath, FileOutputMode mode); //takes ownership!
    ~FileOutputPlain();

    //may return short! CONTRACT: bytesToWrite > 0
    size_t tryWrite(const void* buffer, size_t bytesToWrite); //throw FileError

    //write all or throw
    void write(const void* buffer, size_t bytesToWrite); //throw FileError

    //commit written data to the storage device
    void flushToDisk(); //throw FileError

    //close() when done, or else file is considered incomplete and will be deleted (FileOutputMode::createNew)!

private:
    const FileOutputMode mode_;
};

//-----------------------------------------------------------------------------------------------
//stream I/O convenience functions:

Zstring getPathWithTempName(const Zstring& filePath); //generate (hopefully) unique file name

[[nodiscard]] std::string getFileContent(const Zstring& filePath, const IoCallback& notifyUnbufferedIO /*throw X*/); //throw FileError, X

//overwrites if existing + transactional! :)
void setFileContent(const Zstring& filePath, std::string_view bytes, const IoCallback& notifyUnbufferedIO /*throw X*/); //throw FileError, X
}

#endif //FILE_IO_H_3019283745610293
