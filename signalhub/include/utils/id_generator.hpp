#ifndef SIGNALHUB_ID_GENERATOR_HPP
#define SIGNALHUB_ID_GENERATOR_HPP

#include <string>

namespace signalhub {

class IdGenerator {
public:
    /**
     * Random RFC 4122 version 4 identifier, e.g. "3f2b8c1e-9d4a-4e6f-a1b2-0c3d4e5f6a7b".
     * Returns an empty string if the system RNG fails.
     */
    static std::string generatePeerId();

    // True if `id` has the 8-4-4-4-12 lowercase hex layout with version 4.
    static bool isUuidV4(const std::string& id);
};

} // namespace signalhub

#endif // SIGNALHUB_ID_GENERATOR_HPP
