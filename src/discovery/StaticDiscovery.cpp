#include "discovery/StaticDiscovery.hpp"
#include "sources/model/Source.hpp"

using namespace mds::discovery;

StaticDiscovery::StaticDiscovery(std::vector<std::string> paths, std::vector<std::string> extensions)
    : paths_(std::move(paths)), extensions_(std::move(extensions)) {}

Discovery StaticDiscovery::discover(const sources::model::Source& source, bool) {
    Discovery out;
    out.paths = sanitizePaths(paths_, extensions_, source.id);
    out.manifest_etag = source.last_etag;
    return out;
}
