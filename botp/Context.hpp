/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef BOTP_CONTEXT_HPP
#define BOTP_CONTEXT_HPP

#include "otp/Counter.hpp"
#include <memory>
#include <string>

namespace botp {

/**
 * An object holding app-wide information, such as paths
 * and the default time step.
 */
class Context
{
public:
    Context(const std::string &rootDir, const TimeStep &timeStep,
            bool diagnostics);

    /**
     * The directory holding the log files, with a trailing slash.
     */
    const std::string &rootDir() const { return rootDir_; }

    const TimeStep &timeStep() const { return timeStep_; }

    /**
     * True if code generation should send its intermediate
     * values to the debug log.
     */
    bool diagnostics() const { return diagnostics_; }

private:
    const std::string rootDir_;
    const TimeStep timeStep_;
    const bool diagnostics_;
};

/**
 * The global context instance.
 */
extern std::unique_ptr<Context> gContext;

} // namespace botp

#endif
