// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef PATH_FILTER_H_8820193746510293
#define PATH_FILTER_H_8820193746510293

#include <vector>
#include <rbm/zstring.h>


namespace robo
{
/*  glob patterns matched against a single item name:
    - '*' matches any sequence, '?' matches one character, everything else is literal
    - anchored: the whole name must match
    - case-insensitive and independent of Unicode normalization
    - patterns that are not valid UTF-8 fall back to an exact, case-sensitive comparison   */
class NameMatcher
{
public:
    explicit NameMatcher(const std::vector<Zstring>& patterns);

    bool matches(const Zstring& itemName) const;
    bool empty() const { return masks_.empty() && exactNames_.empty(); }

private:
    std::vector<Zstring> masks_;      //upper-case + Unicode-normalized
    std::vector<Zstring> exactNames_; //compilation failed
};


//compiled once per job
class PathFilter
{
public:
    PathFilter(const std::vector<Zstring>& includeFiles,
               const std::vector<Zstring>& excludeFiles,
               const std::vector<Zstring>& excludeFolders) :
        includeFiles_(includeFiles),
        excludeFiles_(excludeFiles),
        excludeFolders_(excludeFolders) {}

    bool passFileFilter(const Zstring& fileName) const
    {
        if (excludeFiles_.matches(fileName))
            return false;
        return includeFiles_.empty() || includeFiles_.matches(fileName);
    }

    //false: skip the complete subtree
    bool passFolderFilter(const Zstring& folderName) const { return !excludeFolders_.matches(folderName); }

private:
    const NameMatcher includeFiles_;
    const NameMatcher excludeFiles_;
    const NameMatcher excludeFolders_;
};
}

#endif //PATH_FILTER_H_8820193746510293
