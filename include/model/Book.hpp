#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tankobon::model {

enum class LifecycleState {
    Active,
    Completed,
};

enum class DiscoveryStatus {
    Pending,
    Discovered,
    Failed,
};

// Source-declared order of the chapter list
enum class ChapterOrder {
    ReadingOrder,
    NewestFirst,
};

enum class HandleKind {
    Href,       // Chapter reached by following a link
    ElementId,  // Chapter reached by clicking an element with this id
};

struct Book {
    std::string id;
    std::string title;
    std::string site_tag;
    LifecycleState state = LifecycleState::Active;

    bool operator==(const Book&) const = default;
};

struct Chapter {
    int index = 0;          // 1-based reading order, stable across runs
    std::string name;
    std::string handle;
    HandleKind handle_kind = HandleKind::Href;
    DiscoveryStatus status = DiscoveryStatus::Pending;

    bool operator==(const Chapter&) const = default;
};

// Transient output of the normalizer; never persisted on its own
struct EncodedImage {
    std::vector<uint8_t> data;  // JPEG bytes
    int width = 0;
    int height = 0;
};

// The two persisted outputs of one chapter
struct ChapterArtifacts {
    int index = 0;
    std::string name;
    std::filesystem::path url_list;
    std::filesystem::path document;
};

}  // namespace tankobon::model
