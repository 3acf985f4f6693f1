// HomeStream - Now playing list documents
// XML bodies of the browse commands (QueryContainer, QueryServer, QueryFormats)

#pragma once

#include <string>
#include <vector>

#include "../models/Recording.hpp"

namespace homestream::core::server {

inline constexpr const char* kVideoContainerType = "x-container/tivo-videos";
inline constexpr const char* kFolderFormat = "x-container/folder";

struct ContainerEntry {
    bool isFolder{false};
    std::string url;
    std::string mime;         // items
    int totalItems{0};        // folders
    std::string detailsUrl;   // items: TVBusQuery link, may be empty
    Recording recording;      // title is the display name for both kinds
};

struct ContainerPage {
    std::string title;
    std::string contentType{kVideoContainerType};
    int totalItems{0};
    int itemStart{0};
    std::vector<ContainerEntry> entries;
};

class NowPlayingList {
public:
    static std::string render(const ContainerPage& page);
    static std::string serverInfo(const std::string& name, const std::string& version);
    static std::string formats(bool transportStream);

    /**
     * TvBusMarshalledStruct document describing one recording (the
     * TiVoVideoDetails link target). An invalid file gets the envelope
     * without program details.
     */
    static std::string tvBusDetails(const Recording& recording, bool valid);
};

} // namespace homestream::core::server
