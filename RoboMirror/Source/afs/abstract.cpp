// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#include "abstract.h"

using namespace rbm;
using namespace robo;


namespace
{
void traverseFolderLevel(const AFS& afs, const Zstring& folderPath, const Zstring& relPath, bool isBaseFolder, //throw FileError, X
                         AFS::TraverserCallback& cb)
{
    std::vector<AFS::FileInfo>    files;
    std::vector<AFS::FolderInfo>  folders;
    std::vector<AFS::SymlinkInfo> symlinks;
    try
    {
        afs.traverseFolder(folderPath,
        [&](const AFS::FileInfo&    fi) { files   .push_back(fi); },
        [&](const AFS::FolderInfo&  fi) { folders .push_back(fi); },
        [&](const AFS::SymlinkInfo& si) { symlinks.push_back(si); }); //throw FileError
    }
    catch (const FileError& e)
    {
        if (isBaseFolder)
            throw;
        cb.reportDirError(e, relPath); //throw X
        return;
    }

    for (const AFS::FileInfo& fi : files)
        cb.onFile(fi, appendPath(relPath, fi.itemName)); //throw X

    for (const AFS::SymlinkInfo& si : symlinks)
        cb.onSymlink(si, appendPath(relPath, si.itemName)); //throw X

    for (const AFS::FolderInfo& fi : folders)
    {
        const Zstring& relPathSub = appendPath(relPath, fi.itemName);

        if (cb.onFolder(fi, relPathSub) == AFS::TraverseControl::descend) //throw X
            traverseFolderLevel(afs, appendPath(folderPath, fi.itemName), relPathSub, false /*isBaseFolder*/, cb); //throw X
    }
}
}


void AFS::traverseFolderRecursive(const Zstring& baseFolderPath, TraverserCallback& cb) const //throw FileError, X
{
    traverseFolderLevel(*this, baseFolderPath, Zstring(), true /*isBaseFolder*/, cb); //throw FileError, X
}
