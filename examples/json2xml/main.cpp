// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.
//
// json2xml: convert a JSON document to XML without building it in memory.

#include "json2xml.h"

auto main(int argc, const char *argv[]) -> int
{
    return jsonevent::tools::json2xml_main(argc, argv);
}
