// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef FILE_PATH_H_6610293847561029
#define FILE_PATH_H_6610293847561029

#include <optional>
#include "zstring.h"
#include "string_tools.h"


namespace rbm
{
//"/" => no parent; "/folder" => "/"; "folder/file" => "folder"
std::optional<Zstring> getParentFolderPath(const Zstring& itemPath);

inline Zstring getItemName(const Zstring& itemPath) { return afterLast(itemPath, FILE_NAME_SEPARATOR, IfNotFoundReturn::all); }

//relative path: no leading/trailing separator
bool isValidRelPath(const Zstring& relPath);

Zstring appendPath(const Zstring& basePath, const Zstring& relPath);

//remove trailing separators, except for the root folder "/"
Zstring trimTrailingSeparators(Zstring path);
}

#endif //FILE_PATH_H_6610293847561029
