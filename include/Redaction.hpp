#ifndef REDACTION_HPP
#define REDACTION_HPP

#include <string>
#include <string_view>

/**
 * redaction - Marks diagnostic detail that must never reach the client
 *
 * Hidden text is wrapped between two invisible code points (U+2062 and
 * U+2063, UTF-8 encoded). Errors keep the hidden text so logs can show
 * it; responses go through clean() first.
 */
namespace redaction {

inline constexpr std::string_view kHiddenStart = "\xE2\x81\xA2";
inline constexpr std::string_view kHiddenEnd = "\xE2\x81\xA3";

/** Wrap text so that clean() removes it */
std::string hide(std::string_view text);

/**
 * Remove every hidden segment
 *
 * An unterminated segment is removed up to the end of the string.
 * Separators left dangling at the end (": ", spaces) are trimmed.
 */
std::string clean(std::string_view text);

/** Remove the markers only, keeping hidden content (for logs) */
std::string reveal(std::string_view text);

} // namespace redaction

#endif // REDACTION_HPP
