#include <sp/sysctl.h>
#include <sp/line_scanner.h>

namespace sp {

Document parse_sysctl(const std::string& text, const ParseOptions& options) {
    DocumentBuilder builder(options.duplicates);
    LineScanner scanner(text);
    while (auto l = scanner.next()) {
        builder.add(parse_entry(*l));
    }
    return builder.finish();
}

}  // namespace sp
