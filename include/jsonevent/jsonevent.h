// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef JSONEVENT_JSONEVENT_H
#define JSONEVENT_JSONEVENT_H

#include "common.h"
#include "lexer.h"
#include "options.h"
#include "parser.h"
#include "result.h"
#include "slice.h"
#include "source.h"
#include "status.h"
#include "token.h"
#include "xml.h"

#endif // JSONEVENT_JSONEVENT_H
