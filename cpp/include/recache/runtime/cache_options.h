#ifndef RECACHE_CACHE_OPTIONS_H
#define RECACHE_CACHE_OPTIONS_H

#include <cstddef>
#include <string>

namespace recache {

    struct CacheOptions {
        // Name used in traces and dumps
        std::string label{"cache"};
        // How far past the cursor a moved call is looked for before a new entry is inserted
        std::size_t max_search_distance{1024};
        // Print the table after every committed pass, also enabled by RECACHE_DEBUG_DUMP
        bool dump_after_pass{false};
    };

} // namespace recache

#endif //RECACHE_CACHE_OPTIONS_H
