#ifndef SRC_RECORDC_TEMPLATES_HPP_
#define SRC_RECORDC_TEMPLATES_HPP_

// fmt format strings for the generated C sources. Literal braces in the C code are doubled. Named arguments:
//   {name}        record name, also the C type name
//   {header}      header file name
//   {field}       JSON key of a field
//   {member}      C member name of a field
//   {ctype}       C type of a field
//   {members}, {matchers}, {releases}, {serializers}   concatenated per-field snippets

namespace recordc {
namespace templates {

// The header ends with the guard marker the Builder splits on.
extern const char* kHeader;
extern const char* kMember;

extern const char* kImplementation;

// Per-field branches of the key matching chain in parse_<name>().
extern const char* kMatchString;
extern const char* kMatchInteger;
extern const char* kMatchBoolean;

extern const char* kReleaseString;

// Per-field serialization into the SUCCESS|v1|...|vN line.
extern const char* kSerializeString;
extern const char* kSerializeInteger;
extern const char* kSerializeBoolean;

// Driver programs, one per runtime strategy.
extern const char* kProcessDriver;
extern const char* kWorkerDriver;

} // namespace templates
} // namespace recordc

#endif // SRC_RECORDC_TEMPLATES_HPP_
