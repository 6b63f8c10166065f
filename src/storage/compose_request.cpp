#include "chunkup/storage/compose_request.hpp"

#include <nlohmann/json.hpp>

namespace chunkup::storage {

using json = nlohmann::json;

std::string to_json_body(const ComposeRequest& request) {
    json sources = json::array();
    for (const auto& source : request.sources) {
        json entry;
        entry["name"] = source.name;
        if (source.generation != 0) {
            entry["generation"] = source.generation;
        }
        sources.push_back(std::move(entry));
    }

    json body;
    body["kind"] = "storage#composeRequest";
    body["destination"] = json{{"name", request.destination}};
    body["sourceObjects"] = std::move(sources);
    return body.dump();
}

} // namespace chunkup::storage
