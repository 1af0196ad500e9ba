#include <boost/filesystem.hpp>

#include "rollup.hpp"

namespace fs = boost::filesystem;

Hits rollup(const Hits& hits, const std::string& root) {
    std::string top = root;
    while (top.size() > 1 && top.back() == '/')
        top.pop_back();

    Hits dirs;
    for (const auto& [path, stamp] : hits) {
        fs::path dir = fs::path(path).parent_path();

        while (!dir.empty()) {
            auto [it, inserted] = dirs.emplace(dir.string(), stamp);
            if (!inserted) {
                // everything above was already raised to at least this
                if (it->second >= stamp)
                    break;
                it->second = stamp;
            }

            if (it->first.size() <= top.size())
                break;
            dir = dir.parent_path();
        }
    }
    return dirs;
}
