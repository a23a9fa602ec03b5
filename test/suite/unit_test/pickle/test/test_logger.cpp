/* Flow-Pickle: Structural Pickling
 * Copyright (c) 2023 Akamai Technologies, Inc.; and other contributors.
 * Each commit is copyright by its respective author or author's employer.
 *
 * Licensed under the MIT License:
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE. */

/// @file
#include "pickle/test/test_logger.hpp"
#include <flow/log/config.hpp>
#include <flow/log/simple_ostream_logger.hpp>

namespace pickle::test
{

namespace
{

flow::log::Config make_config()
{
  using flow::Flow_log_component;
  using flow::log::Config;
  using flow::log::Sev;

  Config config(Sev::S_WARNING);
  config.init_component_to_union_idx_mapping<Flow_log_component>(1000, 999);
  config.init_component_to_union_idx_mapping<Log_component>(2000, 999);
  config.init_component_names<Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "flow-");
  config.init_component_names<Log_component>(S_PICKLE_LOG_COMPONENT_NAME_MAP, false, "pickle-");
  return config;
}

} // namespace (anon)

// Implementations.

flow::log::Logger* test_logger()
{
  static flow::log::Config s_config = make_config();
  static flow::log::Simple_ostream_logger s_logger(&s_config);
  return &s_logger;
}

} // namespace pickle::test
