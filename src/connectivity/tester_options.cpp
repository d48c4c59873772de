#include <linkguard/connectivity/tester_options.h>

namespace linkguard::connectivity {

std::vector<std::string> DefaultDnsServers() {
    return {"1.1.1.1:53", "8.8.8.8:53", "9.9.9.9:53", "208.67.222.222:53"};
}

std::vector<std::string> DefaultHttpUrls() {
    return {"https://google.com", "https://cloudflare.com", "https://amazon.com"};
}

std::vector<std::string> DefaultDnsTestDomains() {
    return {"google.com", "cloudflare.com", "amazon.com"};
}

} // namespace linkguard::connectivity
