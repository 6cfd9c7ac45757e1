// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <utils/parseargs.hh>

static ArgDesc* findArg (ArgDesc* args, const char* arg) {
    for (ArgDesc* p = args; p->arg; ++p) {
        if (p->kind < argFlagDummy && !strcmp (p->arg, arg)) {
            return p;
        }
    }

    return 0;
}

static bool grabArg (ArgDesc* arg, int i, int* argc, char* argv []) {
    int n = 0;
    bool ok = true;

    switch (arg->kind) {
    case argFlag:
        *(bool*)arg->val = true;
        n = 1;
        break;

    case argInt:
        if (i + 1 < *argc && isInt (argv [i + 1])) {
            *(int*)arg->val = atoi (argv [i + 1]);
            n = 2;
        }
        else {
            ok = false;
            n = 1;
        }
        break;

    case argFP:
        if (i + 1 < *argc && isFP (argv [i + 1])) {
            *(double*)arg->val = atof (argv [i + 1]);
            n = 2;
        }
        else {
            ok = false;
            n = 1;
        }
        break;

    case argString:
        if (i + 1 < *argc) {
            strncpy ((char*)arg->val, argv [i + 1], arg->size - 1);
            ((char*)arg->val) [arg->size - 1] = '\0';
            n = 2;
        }
        else {
            ok = false;
            n = 1;
        }
        break;

    default:
        fprintf (stderr, "Internal error in arg table\n");
        n = 1;
        break;
    }

    if (n > 0) {
        *argc -= n;

        for (int j = i; j <= *argc; ++j) {
            argv [j] = argv [j + n];
        }
    }

    return ok;
}

bool parseArgs (ArgDesc* args, int* argc, char* argv []) {
    bool ok = true;

    for (int i = 1; i < *argc;) {
        if (!strcmp (argv [i], "--")) {
            --*argc;

            for (int j = i; j <= *argc; ++j) {
                argv [j] = argv [j + 1];
            }

            break;
        }
        else if (ArgDesc* arg = findArg (args, argv [i])) {
            if (!grabArg (arg, i, argc, argv)) {
                ok = false;
            }
        }
        else {
            ++i;
        }
    }

    return ok;
}

void printUsage (const char* program, const char* otherArgs, ArgDesc* args) {
    size_t w = 0;

    for (ArgDesc* p = args; p->arg; ++p) {
        w = (std::max) (w, strlen (p->arg));
    }

    fprintf (stderr, "Usage: %s [options]", program);

    if (otherArgs) {
        fprintf (stderr, " %s", otherArgs);
    }

    fprintf (stderr, "\n");

    for (ArgDesc* p = args; p->arg; ++p) {
        fprintf (stderr, "  %s", p->arg);

        for (size_t i = w - strlen (p->arg); i; --i) {
            fprintf (stderr, " ");
        }

        switch (p->kind) {
        case argInt:
        case argIntDummy:
            fprintf (stderr, " <int>   ");
            break;

        case argFP:
        case argFPDummy:
            fprintf (stderr, " <fp>    ");
            break;

        case argString:
        case argStringDummy:
            fprintf (stderr, " <string>");
            break;

        case argFlag:
        case argFlagDummy:
        default:
            fprintf (stderr, "         ");
            break;
        }

        fprintf (stderr, ": %s\n", p->usage);
    }
}

bool isInt (const char* s) {
    if (*s == '-' || *s == '+') {
        ++s;
    }

    if (!isdigit ((unsigned char)*s)) {
        return false;
    }

    for (; isdigit ((unsigned char)*s); ++s)
        ;

    return 0 == *s;
}

bool isFP (const char* s) {
    int n = 0;

    if (*s == '-' || *s == '+') {
        ++s;
    }

    for (; isdigit ((unsigned char)*s); ++s, ++n)
        ;

    if (*s == '.') {
        ++s;
    }

    for (; isdigit ((unsigned char)*s); ++s, ++n)
        ;

    if (n > 0 && (*s == 'e' || *s == 'E')) {
        ++s;

        if (*s == '-' || *s == '+') {
            ++s;
        }

        if (!isdigit ((unsigned char)*s)) {
            return false;
        }

        for (; isdigit ((unsigned char)*s); ++s)
            ;
    }

    return n > 0 && 0 == *s;
}
