#include "scriptbox/exec/wrapper.hpp"

#include "scriptbox/core/utils.hpp"

namespace scriptbox::exec {

namespace {

// Python text; indentation is significant. The sentinel print sits
// between the two halves.
constexpr std::string_view kEpilogueHead =
    "if __name__ == \"__main__\":\n"
    "    import json\n"
    "    import sys\n"
    "    result = main()\n"
    "    sys.stdout.flush()\n"
    "    print(\"";

constexpr std::string_view kEpilogueTail =
    "\")\n"
    "    try:\n"
    "        print(json.dumps(result))\n"
    "    except Exception as e:\n"
    "        print(json.dumps({\"error\": f\"Error serializing result: {str(e)}\"}))\n"
    "    sys.stdout.flush()\n";

} // anonymous namespace

auto wrap_script(std::string_view source) -> std::string {
    auto body = utils::trim_right(source);

    std::string payload;
    payload.reserve(body.size() + kEpilogueHead.size() + kSentinel.size() +
                    kEpilogueTail.size() + 2);
    payload.append(body);
    payload.append("\n\n");
    payload.append(kEpilogueHead);
    payload.append(kSentinel);
    payload.append(kEpilogueTail);
    return payload;
}

} // namespace scriptbox::exec
