#include "TestHooks.hpp"

#include <utility>

namespace TestHooks {

#ifdef FILE_TAXONOMY_TEST_BUILD
namespace {
HttpTransportProbe& transport_probe_storage() {
    static HttpTransportProbe probe;
    return probe;
}
} // namespace

void set_http_transport_probe(HttpTransportProbe probe) {
    transport_probe_storage() = std::move(probe);
}

void reset_http_transport_probe() {
    transport_probe_storage() = HttpTransportProbe{};
}

const HttpTransportProbe& http_transport_probe() {
    return transport_probe_storage();
}
#endif

} // namespace TestHooks
