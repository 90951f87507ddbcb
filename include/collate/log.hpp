#pragma once

#include <collate/common.hpp>

#include <span>

namespace collate {

class Log {
public:
    /*
     * Append one JSON record to the project log, .collate/logs/<launch time>.log.
     * A "ts" field is added. Safe to call from several threads.
     * The file is named by the UTC launch time. Outside a project (no
     * .collate directory when the first record is written) records are
     * dropped.
     */
    static void log(std::span<StringViewPair const> fields);
};

} // namespace collate
