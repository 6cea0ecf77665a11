/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Context.hpp"
#include "util/FileIO.hpp"

namespace botp {

std::unique_ptr<Context> gContext;

Context::Context(const std::string &rootDir, const TimeStep &timeStep,
                 bool diagnostics):
    rootDir_(fileSlashify(rootDir)),
    timeStep_(timeStep),
    diagnostics_(diagnostics)
{
}

} // namespace botp
