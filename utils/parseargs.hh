// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_UTILS_PARSEARGS_HH
#define TEXTFLOW_UTILS_PARSEARGS_HH

//
// Argument kinds:
//
enum ArgKind {
    argFlag,   // flag (present / not-present), val: bool*
    argInt,    // integer arg, val: int*
    argFP,     // floating point arg, val: double*
    argString, // string arg, val: char*

    //
    // Dummy entries show up in the usage listing only:
    //
    argFlagDummy,
    argIntDummy,
    argFPDummy,
    argStringDummy
};

//
// Argument descriptor; a list of them ends with an empty one:
//
struct ArgDesc {
    const char* arg;   // the command line switch
    ArgKind kind;      // kind of arg
    void* val;         // place to store value
    int size;          // for argString: size of string
    const char* usage; // usage string
};

//
// Parses the command line, removing all args found in the descriptor list.
// Stops at "--" (and removes it). Returns false if there was an error:
//
bool parseArgs (ArgDesc* args, int* argc, char* argv []);

//
// Prints a usage message based on the descriptor list:
//
void printUsage (const char* program, const char* otherArgs, ArgDesc* args);

//
// Checks if a string is a valid integer or floating point number:
//
bool isInt (const char* s);
bool isFP (const char* s);

#endif // TEXTFLOW_UTILS_PARSEARGS_HH
