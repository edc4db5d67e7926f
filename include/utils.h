#ifndef UTILS_H
#define UTILS_H

#include <cstdio>
#include <ctime>

#define DIV_ROUND_UP(n, d) (((n) + (d) - 1) / (d))

#if defined(DEBUG)
#define DB_PRINT(msg, ...) do {                                   \
    char __ts[32];                                                \
    const time_t __tt = time(nullptr);                            \
    strftime(__ts, sizeof(__ts), "%F %T", localtime(&__tt));      \
    printf("%s\t" msg, __ts __VA_OPT__(,) __VA_ARGS__);           \
} while (0)

/* Hex dump, 16 bytes per line. Large frames are cut short. */
#define DB_PRINT_ARRAY(data, size) do {                           \
    const size_t __n = (size) > 256 ? 256 : (size);               \
    for (size_t __i = 0; __i < __n; __i++) {                      \
        printf("%.2x%c", (data)[__i],                             \
                ((__i + 1) % 16 == 0) ? '\n' : ' ');              \
    }                                                             \
    if (__n != (size)) {                                          \
        printf("... (%zu more)", (size_t)((size) - __n));         \
    }                                                             \
    printf("\n");                                                 \
} while (0)
#else
#define DB_PRINT(msg, ...) do {} while (0)
#define DB_PRINT_ARRAY(data, size) do {} while (0)
#endif

#endif
