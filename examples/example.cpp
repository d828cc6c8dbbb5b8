#include "docval.h"
#include <cstdio>
#include <cstring>

void log_cb(DOCVAL_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t len)
{
    printf("[%d][%s:%s:%u]: %.*s\n", level, file, function, line, (int)len, message);
}

int main()
{
    docval_set_log_cb(log_cb, DOCVAL_LOG_TRACE);
    printf("docval %s\n", docval_get_version());

    const char *values[] = {"123.456.789-09", "123.456.789-00", "111.111.111-11",
        "12.345.678/0001-95", "12.345.678/0001-99", "1234"};

    for (const char *value : values) {
        DOCVAL_RET_CODE code = docval_tax_id_validate(value, strlen(value));
        printf("%s => %s\n", value, docval_ret_code_to_string(code));
    }

    char digits[2];
    if (docval_cpf_check_digits("529982247", 9, digits) == DOCVAL_OK) {
        printf("529.982.247-%c%c\n", digits[0], digits[1]);
    }

    docval_set_log_cb(nullptr, DOCVAL_LOG_OFF);
    return 0;
}
