#include "recordc/Templates.hpp"

namespace recordc {
namespace templates {

const char* kHeader = R"c(#ifndef {name}_H
#define {name}_H

// NOTE: recordc automatically generated this file from the {name} record schema.
// Edits will likely be clobbered.

#include <stdbool.h>
#include <stdint.h>

typedef struct {{
{members}}} {name};

int parse_{name}(const char* rc_input, {name}* rc_out);
void release_{name}({name}* rc_out);

char* parse_and_serialize(const char* rc_input);
void free_serialized(char* rc_str);

#endif // {name}_H
)c";

const char* kMember = "    {ctype} {member};\n";

const char* kImplementation = R"c(
#include <inttypes.h>
#include <stdbool.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "{header}"

typedef struct {{
    char* data;
    size_t length;
    size_t capacity;
}} rc_buffer;

static bool rc_buffer_append(rc_buffer* buffer, const char* text, size_t length) {{
    if (buffer->length + length + 1 > buffer->capacity) {{
        size_t capacity = buffer->capacity ? buffer->capacity : 64;
        char* data;
        while (buffer->length + length + 1 > capacity) {{
            capacity *= 2;
        }}
        data = (char*)realloc(buffer->data, capacity);
        if (data == NULL) {{
            return false;
        }}
        buffer->data = data;
        buffer->capacity = capacity;
    }}
    if (length > 0) {{
        memcpy(buffer->data + buffer->length, text, length);
    }}
    buffer->length += length;
    buffer->data[buffer->length] = '\0';
    return true;
}}

static bool rc_buffer_append_string(rc_buffer* buffer, const char* text) {{
    return rc_buffer_append(buffer, text, strlen(text));
}}

static const char* rc_skip_whitespace(const char* ptr) {{
    while (*ptr == ' ' || *ptr == '\n' || *ptr == '\t' || *ptr == '\r') {{
        ptr++;
    }}
    return ptr;
}}

static const char* rc_skip_separators(const char* ptr) {{
    while (*ptr == ' ' || *ptr == '\n' || *ptr == '\t' || *ptr == '\r' || *ptr == ',') {{
        ptr++;
    }}
    return ptr;
}}

// Reads a quoted string starting at its opening quote into a newly allocated buffer. Resolves \" and \\, other
// escape sequences are kept verbatim. Returns the position after the closing quote, or NULL on error.
static const char* rc_parse_string(const char* ptr, char** out) {{
    rc_buffer value = {{ NULL, 0, 0 }};
    if (*ptr != '"') {{
        return NULL;
    }}
    ptr++;
    if (!rc_buffer_append(&value, "", 0)) {{
        return NULL;
    }}
    while (*ptr != '\0' && *ptr != '"') {{
        const char* start = ptr;
        size_t length = 1;
        if (*ptr == '\\') {{
            if (ptr[1] == '\0') {{
                break;
            }}
            if (ptr[1] == '"' || ptr[1] == '\\') {{
                start = ptr + 1;
            }} else {{
                length = 2;
            }}
            ptr += 2;
        }} else {{
            ptr++;
        }}
        if (!rc_buffer_append(&value, start, length)) {{
            free(value.data);
            return NULL;
        }}
    }}
    if (*ptr != '"') {{
        free(value.data);
        return NULL;
    }}
    *out = value.data;
    return ptr + 1;
}}

// Optional minus then at least one digit. Values outside int64_t fail.
static const char* rc_parse_integer(const char* ptr, int64_t* out) {{
    bool negative = false;
    uint64_t limit = (uint64_t)INT64_MAX;
    uint64_t magnitude = 0;
    int digits = 0;
    if (*ptr == '-') {{
        negative = true;
        limit = (uint64_t)INT64_MAX + 1;
        ptr++;
    }}
    while (*ptr >= '0' && *ptr <= '9') {{
        uint64_t digit = (uint64_t)(*ptr - '0');
        if (magnitude > (limit - digit) / 10) {{
            return NULL;
        }}
        magnitude = magnitude * 10 + digit;
        digits++;
        ptr++;
    }}
    if (digits == 0) {{
        return NULL;
    }}
    if (!negative) {{
        *out = (int64_t)magnitude;
    }} else if (magnitude == limit) {{
        *out = INT64_MIN;
    }} else {{
        *out = -(int64_t)magnitude;
    }}
    return ptr;
}}

static const char* rc_parse_boolean(const char* ptr, bool* out) {{
    if (strncmp(ptr, "true", 4) == 0) {{
        *out = true;
        return ptr + 4;
    }}
    if (strncmp(ptr, "false", 5) == 0) {{
        *out = false;
        return ptr + 5;
    }}
    return NULL;
}}

// Skips the value of an unrecognized key, stopping at the comma or closing brace that ends it.
static const char* rc_skip_value(const char* ptr) {{
    int depth = 0;
    bool in_string = false;
    while (*ptr != '\0') {{
        if (in_string) {{
            if (*ptr == '\\' && ptr[1] != '\0') {{
                ptr += 2;
                continue;
            }}
            if (*ptr == '"') {{
                in_string = false;
            }}
        }} else if (*ptr == '"') {{
            in_string = true;
        }} else if (*ptr == '{{' || *ptr == '[') {{
            depth++;
        }} else if (*ptr == '}}' || *ptr == ']') {{
            if (depth == 0) {{
                break;
            }}
            depth--;
        }} else if (*ptr == ',' && depth == 0) {{
            break;
        }}
        ptr++;
    }}
    return ptr;
}}

void release_{name}({name}* rc_out) {{
    (void)rc_out;
{releases}}}

int parse_{name}(const char* rc_input, {name}* rc_out) {{
    const char* rc_ptr = rc_input;
    memset(rc_out, 0, sizeof(*rc_out));

    if (*rc_ptr != '{{') {{
        return -1;
    }}
    rc_ptr++;

    for (;;) {{
        char* rc_key = NULL;

        rc_ptr = rc_skip_separators(rc_ptr);
        if (*rc_ptr == '}}' || *rc_ptr == '\0') {{
            break;
        }}

        rc_ptr = rc_parse_string(rc_ptr, &rc_key);
        if (rc_ptr == NULL) {{
            release_{name}(rc_out);
            return -1;
        }}
        rc_ptr = rc_skip_whitespace(rc_ptr);
        if (*rc_ptr != ':') {{
            free(rc_key);
            release_{name}(rc_out);
            return -1;
        }}
        rc_ptr = rc_skip_whitespace(rc_ptr + 1);

        {matchers}{{
            rc_ptr = rc_skip_value(rc_ptr);
        }}
        free(rc_key);

        if (rc_ptr == NULL) {{
            release_{name}(rc_out);
            return -1;
        }}
    }}

    if (*rc_ptr != '}}') {{
        release_{name}(rc_out);
        return -1;
    }}
    return 0;
}}

char* parse_and_serialize(const char* rc_input) {{
    {name} rc_record;
    rc_buffer rc_serialized = {{ NULL, 0, 0 }};
    char rc_number[32];
    bool rc_ok;

    if (rc_input == NULL || parse_{name}(rc_input, &rc_record) != 0) {{
        return NULL;
    }}
    (void)rc_number;

    rc_ok = rc_buffer_append_string(&rc_serialized, "{success}");
{serializers}
    release_{name}(&rc_record);
    if (!rc_ok) {{
        free(rc_serialized.data);
        return NULL;
    }}
    return rc_serialized.data;
}}

void free_serialized(char* rc_str) {{
    free(rc_str);
}}
)c";

const char* kMatchString = R"c(if (strcmp(rc_key, "{field}") == 0) {{
            free(rc_out->{member});
            rc_out->{member} = NULL;
            rc_ptr = rc_parse_string(rc_ptr, &rc_out->{member});
        }} else )c";

const char* kMatchInteger = R"c(if (strcmp(rc_key, "{field}") == 0) {{
            rc_ptr = rc_parse_integer(rc_ptr, &rc_out->{member});
        }} else )c";

const char* kMatchBoolean = R"c(if (strcmp(rc_key, "{field}") == 0) {{
            rc_ptr = rc_parse_boolean(rc_ptr, &rc_out->{member});
        }} else )c";

const char* kReleaseString = R"c(    free(rc_out->{member});
    rc_out->{member} = NULL;
)c";

const char* kSerializeString = R"c(    rc_ok = rc_ok && rc_buffer_append_string(&rc_serialized, "|");
    rc_ok = rc_ok && rc_buffer_append_string(&rc_serialized, rc_record.{member} != NULL ? rc_record.{member} : "");
)c";

const char* kSerializeInteger = R"c(    snprintf(rc_number, sizeof(rc_number), "|%" PRId64, rc_record.{member});
    rc_ok = rc_ok && rc_buffer_append_string(&rc_serialized, rc_number);
)c";

const char* kSerializeBoolean =
        R"c(    rc_ok = rc_ok && rc_buffer_append_string(&rc_serialized, rc_record.{member} ? "|true" : "|false");
)c";

const char* kProcessDriver = R"c(#include <stdio.h>
#include <stdlib.h>

#include "{header}"

int main(int rc_argc, char* rc_argv[]) {{
    char* rc_result;

    if (rc_argc != 2) {{
        fprintf(stderr, "Usage: %s <json_string>\n", rc_argv[0]);
        return 1;
    }}

    rc_result = parse_and_serialize(rc_argv[1]);
    if (rc_result == NULL) {{
        printf("{failure}\n");
        return 1;
    }}

    // No newline after the payload.
    fputs(rc_result, stdout);
    free_serialized(rc_result);
    return 0;
}}
)c";

const char* kWorkerDriver = R"c(#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "{header}"

static const char rc_failure[] = "{failure}";

// Frames are the decimal payload length, a newline, then the payload bytes.
static int rc_write_frame(const char* payload, size_t length) {{
    if (fprintf(stdout, "%zu\n", length) < 0) {{
        return -1;
    }}
    if (length > 0 && fwrite(payload, 1, length, stdout) != length) {{
        return -1;
    }}
    return fflush(stdout) == 0 ? 0 : -1;
}}

int main(int rc_argc, char* rc_argv[]) {{
    size_t rc_length;

    if (rc_argc != 1) {{
        fprintf(stderr, "Usage: %s < framed_documents\n", rc_argv[0]);
        return 1;
    }}

    while (fscanf(stdin, "%zu", &rc_length) == 1) {{
        char* rc_document;
        char* rc_result;
        int rc_status;

        if (fgetc(stdin) != '\n') {{
            return 1;
        }}
        rc_document = (char*)malloc(rc_length + 1);
        if (rc_document == NULL) {{
            return 1;
        }}
        if (rc_length > 0 && fread(rc_document, 1, rc_length, stdin) != rc_length) {{
            free(rc_document);
            return 1;
        }}
        rc_document[rc_length] = '\0';

        rc_result = parse_and_serialize(rc_document);
        free(rc_document);
        if (rc_result == NULL) {{
            rc_status = rc_write_frame(rc_failure, sizeof(rc_failure) - 1);
        }} else {{
            rc_status = rc_write_frame(rc_result, strlen(rc_result));
            free_serialized(rc_result);
        }}
        if (rc_status != 0) {{
            return 1;
        }}
    }}
    return feof(stdin) ? 0 : 1;
}}
)c";

} // namespace templates
} // namespace recordc
