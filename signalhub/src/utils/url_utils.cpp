#include "../../include/utils/url_utils.hpp"

namespace signalhub {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

} // namespace

std::string urlDecode(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        const char c = value[i];
        if (c == '+') {
            result.push_back(' ');
            continue;
        }
        if (c == '%' && i + 2 < value.size()) {
            int high = hexValue(value[i + 1]);
            int low = hexValue(value[i + 2]);
            if (high >= 0 && low >= 0) {
                result.push_back(static_cast<char>((high << 4) | low));
                i += 2;
                continue;
            }
        }
        result.push_back(c);
    }
    return result;
}

std::map<std::string, std::string> parseQueryString(const std::string& query) {
    std::map<std::string, std::string> params;
    size_t pos = 0;
    while (pos < query.size()) {
        size_t amp_pos = query.find('&', pos);
        if (amp_pos == std::string::npos) amp_pos = query.size();

        const std::string pair = query.substr(pos, amp_pos - pos);
        if (!pair.empty()) {
            const size_t eq_pos = pair.find('=');
            if (eq_pos == std::string::npos) {
                params.emplace(urlDecode(pair), "");
            } else {
                params.emplace(urlDecode(pair.substr(0, eq_pos)), urlDecode(pair.substr(eq_pos + 1)));
            }
        }
        pos = amp_pos + 1;
    }
    return params;
}

void splitTarget(const std::string& target, std::string& path, std::string& query) {
    const size_t q = target.find('?');
    if (q == std::string::npos) {
        path = target;
        query.clear();
        return;
    }
    path = target.substr(0, q);
    query = target.substr(q + 1);
}

} // namespace signalhub
