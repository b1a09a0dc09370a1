#pragma once

#include <sp/document.h>
#include <string>

namespace sp {

// Parse sysctl.conf-style text into a Document. Throws SyntaxFault for a
// malformed line and DuplicateKeyFault for a repeated key under the Reject
// policy; the first fault ends the parse.
Document parse_sysctl(const std::string& text, const ParseOptions& options = ParseOptions{});

}  // namespace sp
