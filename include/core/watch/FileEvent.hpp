//
// Created by Andrea on 18/10/2026.
//

#pragma once

#include <string>

namespace core::watch {
    enum class FileEventKind {
        Created,
        Modified,
        Existing // already present at the first scan, history not ingested
    };

    struct FileEvent {
        FileEventKind kind;
        std::string path;
    };

    inline std::string fileEventKindToString(FileEventKind kind) {
        switch (kind) {
            case FileEventKind::Created: return "CREATED";
            case FileEventKind::Modified: return "MODIFIED";
            case FileEventKind::Existing: return "EXISTING";
            default: return "UNKNOWN";
        }
    }
} // namespace core::watch
