#include <dem_query/platform/library_info.h>
#include <curl/curl.h>
#include <sstream>

#ifndef DEM_QUERY_VERSION
#define DEM_QUERY_VERSION "0.1.0"
#endif

namespace dem_query {

std::string LibraryInfo::GetVersion() {
    return std::string(DEM_QUERY_VERSION);
}

std::string LibraryInfo::GetBuildInfo() {
    std::ostringstream oss;
    oss << "DEM Query " << GetVersion()
        << " (" << curl_version() << ")"
        << " - Built on " << __DATE__ << " " << __TIME__;
    return oss.str();
}

} // namespace dem_query
