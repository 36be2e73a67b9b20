#ifndef SIGNALHUB_JSON_PARSER_HPP
#define SIGNALHUB_JSON_PARSER_HPP

#include <string>
#include <map>
#include <vector>

namespace signalhub {

class JsonParser {
public:
    /**
     * One top-level member of a parsed object.
     * Strings are stored unescaped; every other value (object, array, number,
     * boolean, null) is stored as the raw JSON text it was written as.
     */
    struct Field {
        std::string value;
        bool is_string = false;
    };

    using Object = std::map<std::string, Field>;

    /**
     * Parse the top-level members of a JSON object.
     * Returns false if the text is not exactly one well-formed object.
     */
    static bool parseObject(const std::string& json, Object& out);

    // True if `json` holds exactly one well-formed JSON value.
    static bool isValid(const std::string& json);

    // Strings of a JSON array; empty on malformed input. Non-string elements are skipped.
    static std::vector<std::string> parseStringArray(const std::string& json);

    static const Field* find(const Object& object, const std::string& key);

    // Accepts true/false literals and the strings "true"/"false".
    static bool asBool(const Field& field, bool& out);

    static std::string stringify(const std::map<std::string, std::string>& data);
    static std::string quote(const std::string& str);
    static std::string stringArray(const std::vector<std::string>& values);
    static std::string createErrorResponse(const std::string& message);
    static std::string escapeJson(const std::string& str);
    static std::string unescapeJson(const std::string& str);
};

} // namespace signalhub

#endif // SIGNALHUB_JSON_PARSER_HPP
