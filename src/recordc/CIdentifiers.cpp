#include "recordc/CIdentifiers.hpp"

#include <unordered_set>

namespace recordc {

namespace {

const std::unordered_set<std::string_view> kKeywordsAndMacros {
    // C99 keywords, plus the stdbool.h macros.
    "auto", "break", "case", "char", "const", "continue", "default", "do", "double", "else", "enum", "extern",
    "float", "for", "goto", "if", "inline", "int", "long", "register", "restrict", "return", "short", "signed",
    "sizeof", "static", "struct", "switch", "typedef", "union", "unsigned", "void", "volatile", "while", "bool",
    "true", "false",
    // stdio.h, stdlib.h and string.h.
    "NULL", "EOF", "BUFSIZ", "FILENAME_MAX", "FOPEN_MAX", "L_tmpnam", "TMP_MAX", "SEEK_CUR", "SEEK_END", "SEEK_SET",
    "stdin", "stdout", "stderr", "EXIT_FAILURE", "EXIT_SUCCESS", "RAND_MAX", "MB_CUR_MAX", "errno",
    "WEXITSTATUS", "WIFEXITED", "WIFSIGNALED", "WIFSTOPPED", "WNOHANG", "WSTOPSIG", "WTERMSIG", "WUNTRACED",
    // stdint.h limits that the prefix rules below do not cover.
    "SIZE_MAX", "PTRDIFF_MIN", "PTRDIFF_MAX", "SIG_ATOMIC_MIN", "SIG_ATOMIC_MAX", "WCHAR_MIN", "WCHAR_MAX",
    "WINT_MIN", "WINT_MAX"
};

// Functions and types declared by the included headers, and the identifiers the generated code defines itself.
const std::unordered_set<std::string_view> kLibraryAndGenerated {
    // stdio.h
    "FILE", "remove", "rename", "tmpfile", "tmpnam", "fclose", "fflush", "fopen", "freopen", "setbuf", "setvbuf",
    "fprintf", "fscanf", "printf", "scanf", "snprintf", "sprintf", "sscanf", "vfprintf", "vfscanf", "vprintf",
    "vscanf", "vsnprintf", "vsprintf", "vsscanf", "fgetc", "fgets", "fputc", "fputs", "getc", "getchar", "gets",
    "putc", "putchar", "puts", "ungetc", "fread", "fwrite", "fgetpos", "fseek", "fsetpos", "ftell", "rewind",
    "clearerr", "feof", "ferror", "perror", "fileno", "fdopen", "popen", "pclose", "getline", "getdelim", "dprintf",
    // stdlib.h
    "atof", "atoi", "atol", "atoll", "strtod", "strtof", "strtold", "strtol", "strtoll", "strtoul", "strtoull",
    "rand", "srand", "calloc", "free", "malloc", "realloc", "abort", "atexit", "exit", "getenv", "system", "bsearch",
    "qsort", "abs", "labs", "llabs", "div", "ldiv", "lldiv", "mblen", "mbtowc", "wctomb", "mbstowcs", "wcstombs",
    "random", "srandom", "setenv", "unsetenv", "mkstemp", "mkdtemp", "realpath",
    // string.h
    "memcpy", "memmove", "strcpy", "strncpy", "strcat", "strncat", "memcmp", "strcmp", "strcoll", "strncmp",
    "strxfrm", "memchr", "strchr", "strcspn", "strpbrk", "strrchr", "strspn", "strstr", "strtok", "memset",
    "strerror", "strlen", "strdup", "strndup", "strnlen", "stpcpy", "strtok_r",
    // inttypes.h
    "imaxabs", "imaxdiv", "strtoimax", "strtoumax", "wcstoimax", "wcstoumax",
    // Generated code.
    "main", "parse_and_serialize", "free_serialized", "and_serialize"
};

bool startsWith(std::string_view name, std::string_view prefix) {
    return name.size() >= prefix.size() && name.substr(0, prefix.size()) == prefix;
}

bool endsWith(std::string_view name, std::string_view suffix) {
    return name.size() >= suffix.size() && name.substr(name.size() - suffix.size()) == suffix;
}

bool isUpperCaseOrDigits(std::string_view name) {
    for (auto c : name) {
        if (!((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_')) { return false; }
    }
    return true;
}

// INT64_MAX, UINT8_C, INTMAX_MIN, PRId64, SCNuPTR and the rest of the stdint.h and inttypes.h macro families.
bool isIntegerMacro(std::string_view name) {
    if (startsWith(name, "PRI") || startsWith(name, "SCN")) {
        if (name.size() < 5 || std::string_view("diouxX").find(name[3]) == std::string_view::npos) { return false; }
        return isUpperCaseOrDigits(name.substr(4));
    }
    if (startsWith(name, "U")) { name.remove_prefix(1); }
    if (!startsWith(name, "INT") || !isUpperCaseOrDigits(name)) { return false; }
    auto rest = name.substr(3);
    return (!rest.empty() && rest[0] >= '0' && rest[0] <= '9') || startsWith(rest, "MAX") || startsWith(rest, "PTR")
            || startsWith(rest, "_LEAST") || startsWith(rest, "_FAST");
}

} // namespace

bool isCKeywordOrMacro(std::string_view name) {
    if (startsWith(name, "__")) { return true; }
    if (name.size() > 1 && name[0] == '_' && name[1] >= 'A' && name[1] <= 'Z') { return true; }
    return kKeywordsAndMacros.count(name) || isIntegerMacro(name);
}

bool isReservedRecordName(std::string_view name) {
    if (isCKeywordOrMacro(name) || kLibraryAndGenerated.count(name)) { return true; }
    return startsWith(name, "rc_") || endsWith(name, "_t");
}

} // namespace recordc
