// -*- mode:c++;indent-tabs-mode:nil;c-basic-offset:4;coding:utf-8 -*-
// vi: set et ft=cpp ts=4 sts=4 sw=4 fenc=utf-8 :vi
//
// Copyright 2024 Mozilla Foundation
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <cstdio>
#include <cstdlib>
#include <string>
#include <sys/wait.h>

#ifndef JNQ_PATH
#error "JNQ_PATH must name the jnq executable"
#endif
#ifndef JNAV_SOURCE_DIR
#error "JNAV_SOURCE_DIR must name the source tree"
#endif

#define ARRAYLEN(A) \
    ((sizeof(A) / sizeof(*(A))) / ((unsigned)!(sizeof(A) % sizeof(*(A)))))

static const std::string kData = JNAV_SOURCE_DIR "/tools/testdata/";

// Runs jnq with `args` through the shell, capturing stdout. Returns the
// exit status, or -1 if the process did not exit normally.
static int
Run(const std::string& args, std::string* out)
{
    std::string command = "\"" JNQ_PATH "\" " + args + " 2>/dev/null";
    FILE* f = popen(command.c_str(), "r");
    if (!f) {
        perror("popen");
        exit(100);
    }
    out->clear();
    char buf[256];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), f)) > 0)
        out->append(buf, n);
    int status = pclose(f);
    if (status == -1 || !WIFEXITED(status))
        return -1;
    return WEXITSTATUS(status);
}

static const struct
{
    const char* args;
    int status;
    const char* output;
} kCases[] = {
    // success
    { "--file MENU menu.popup.menuitem.[1].value", 0, "Open\n" },
    { "--file MENU --type length menu.popup.menuitem", 0, "3\n" },
    { "--file MENU --type shape '$'", 0, "object\n" },
    { "--file MENU --type keys menu.popup.menuitem.[0]", 0, "value\nonclick\n" },
    { "--file MENU --type date menu.created", 0, "2024-02-29\n" },
    { "--file MENU --type long menu.note", 0, "null\n" },
    { "--type string menu.id < MENU", 0, "file\n" },
    // navigation or coercion failure
    { "--file MENU menu.missing", 1, "" },
    { "--file MENU menu.popup.menuitem.[3]", 1, "" },
    { "--file MENU --type long menu.id", 1, "" },
    { "--file MENU --type datetime menu.far", 1, "" },
    { "--file MENU --type length menu.id", 1, "" },
    // usage, decode or path syntax error
    { "--file MENU menu.popup.menuitem[0]", 2, "" },
    { "--file MENU menu..id", 2, "" },
    { "--file MENU --type nope menu.id", 2, "" },
    { "--file MENU", 2, "" },
    { "--file MENU --bogus menu.id", 2, "" },
    { "--file MENU menu.id menu.id", 2, "" },
    { "--file BROKEN menu.id", 2, "" },
    { "--file MISSING menu.id", 2, "" },
};

// Swaps the MENU, BROKEN and MISSING placeholders for real paths.
static std::string
Expand(std::string args)
{
    static const struct
    {
        const char* name;
        const char* file;
    } kFiles[] = {
        { "MENU", "menu.json" },
        { "BROKEN", "broken.json" },
        { "MISSING", "missing.json" },
    };
    for (size_t i = 0; i < ARRAYLEN(kFiles); ++i) {
        size_t pos = args.find(kFiles[i].name);
        if (pos != std::string::npos)
            args.replace(pos,
                         std::string(kFiles[i].name).size(),
                         "\"" + kData + kFiles[i].file + "\"");
    }
    return args;
}

void
exit_status_test()
{
    std::string out;
    for (size_t i = 0; i < ARRAYLEN(kCases); ++i) {
        int status = Run(Expand(kCases[i].args), &out);
        if (status != kCases[i].status) {
            printf("error: jnq %s exited %d but wanted %d\n",
                   kCases[i].args,
                   status,
                   kCases[i].status);
            exit(1);
        }
        if (out != kCases[i].output) {
            printf("error: jnq %s printed \"%s\" but wanted \"%s\"\n",
                   kCases[i].args,
                   out.c_str(),
                   kCases[i].output);
            exit(2);
        }
    }
}

void
help_test()
{
    std::string out;
    if (Run("--help", &out) != 0)
        exit(10);
    if (out.find("usage: jnq") != 0)
        exit(11);
}

int
main()
{
    exit_status_test();
    help_test();
}
