#include "Macros.hpp"

#include <cstdio>
#include <cstdlib>

int global_verbose_mode = 0;

void myexit(int flag)
{
    switch (flag) {
        case ERRSUCCESS:
            break;
        case ERRFileIO:
            fprintf(stderr, "\n\n Exit with file IO error (code %d).\n", flag);
            break;
        case ERRDATAIN:
            fprintf(stderr, "\n\n Exit with invalid input data (code %d).\n", flag);
            break;
        case ERRCONSIS:
            fprintf(stderr, "\n\n Exit with inconsistent configuration (code %d).\n", flag);
            break;
        default:
            fprintf(stderr, "\n\n Exit with unknown error (code %d).\n", flag);
            break;
    }
    fflush(stderr);
    fflush(stdout);
    exit(flag);
}
