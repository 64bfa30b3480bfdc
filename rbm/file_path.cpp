// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#include "file_path.h"
#include <cassert>

using namespace rbm;


std::optional<Zstring> rbm::getParentFolderPath(const Zstring& itemPath)
{
    const Zstring path = trimTrailingSeparators(itemPath);

    if (path.empty() || path == Zstr("/"))
        return std::nullopt;

    const size_t pos = path.rfind(FILE_NAME_SEPARATOR);
    if (pos == Zstring::npos)
        return std::nullopt; //relative single-component path

    if (pos == 0)
        return Zstring(Zstr("/"));

    return path.substr(0, pos);
}


bool rbm::isValidRelPath(const Zstring& relPath)
{
    const bool doubleSep = contains(relPath, Zstr("//"));

    return !doubleSep &&
           !startsWith(relPath, Zstr("/")) &&
           !endsWith  (relPath, Zstr("/"));
}


Zstring rbm::appendPath(const Zstring& basePath, const Zstring& relPath)
{
    assert(isValidRelPath(relPath));
    if (relPath.empty())
        return basePath;

    if (basePath.empty()) //basePath might be a relative path, too!
        return relPath;

    if (endsWith(basePath, Zstr("/")))
        return basePath + relPath;

    return basePath + FILE_NAME_SEPARATOR + relPath;
}


Zstring rbm::trimTrailingSeparators(Zstring path)
{
    while (path.size() > 1 && path.back() == FILE_NAME_SEPARATOR)
        path.pop_back();
    return path;
}
