// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef ENUMERATE_H_3310293847561092
#define ENUMERATE_H_3310293847561092

#include <atomic>
#include <deque>
#include "structures.h"
#include "path_filter.h"


namespace robo
{
//written by the scanning thread, polled by the coordinator
struct ScanStatus
{
    std::atomic<int> itemsScanned{0};
    std::atomic<int> filesFound  {0};
};


struct ScanItem
{
    CandidateFile file;
    std::optional<SkipReason> skipReason; //set: target is up to date => no transfer
};


/*  lazy, single-pass walk of the source tree:
    - hidden items are skipped (optional)
    - excluded folders are skipped including their subtree
    - file patterns and size limits drop files silently
    - files are diffed against the target: identical or newer target => ScanItem::skipReason     */
class SourceScanner
{
public:
    SourceScanner(const JobConfig& cfg, const AbstractFileSystem& afs, ScanStatus* status /*optional*/); //throw ErrorSourceNotFound

    std::optional<ScanItem> getNext(); //unreadable sub folders => getWarnings()

    const Zstring& getSourceRoot() const { return sourceRoot_; } //symlinks resolved

    //non-excluded source sub folders (relative paths), parents before children
    const std::vector<Zstring>& getFolders() const { return folders_; }

    //sub folders that could not be read
    const std::vector<std::wstring>& getWarnings() const { return warnings_; }

private:
    SourceScanner           (const SourceScanner&) = delete;
    SourceScanner& operator=(const SourceScanner&) = delete;

    void readFolder(const Zstring& relPath); //throw FileError
    std::optional<SkipReason> diffAgainstTarget(const CandidateFile& file) const;
    bool passSizeFilter(uint64_t fileSize) const;

    const JobConfig& cfg_;
    const AbstractFileSystem& afs_;
    ScanStatus* const status_;
    const PathFilter filter_;

    Zstring sourceRoot_;

    std::vector<Zstring> pendingFolders_; //relative paths; depth-first
    std::deque<CandidateFile> pendingFiles_;

    std::vector<Zstring> folders_;
    std::vector<std::wstring> warnings_;
};


struct ScanResult
{
    Zstring sourceRoot;
    std::vector<CandidateFile> filesToCopy;
    std::vector<ScanItem> filesSkipped;
    std::vector<Zstring> folders; //relative paths, parents first
    std::vector<std::wstring> warnings;
};

//drain a SourceScanner; a fresh scan is required per run
ScanResult scanSource(const JobConfig& cfg, const AbstractFileSystem& afs, ScanStatus* status /*optional*/); //throw ErrorSourceNotFound
}

#endif //ENUMERATE_H_3310293847561092
