// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#pragma once

#include "configbase.h"

namespace batchgate::config {

////
//// logging
////
// Directory of the glog files. Empty means glog's default (usually /tmp).
CONF_String(sys_log_dir, "");
// INFO, WARNING, ERROR, FATAL
CONF_String(sys_log_level, "INFO");
// SIZE-MB-nnn: roll the log file once it reaches nnn megabytes.
CONF_String(sys_log_roll_mode, "SIZE-MB-1024");
// Modules that log at sys_log_verbose_level, e.g. "fifo_semaphore,token_budget_ledger".
CONF_Strings(sys_log_verbose_modules, "");
CONF_Int32(sys_log_verbose_level, "10");

////
//// batch admission
////
// Hard ceiling on batches running at once when the caller does not pass one.
CONF_mInt32(batch_max_concurrent, "3");
// Fraction of the summed per-batch provider limits handed to the token ledger, in (0, 1].
CONF_mDouble(batch_budget_safety_ratio, "0.8");
// Plan budgets against the conservative provider limits instead of the advertised ones.
CONF_mBool(batch_use_conservative_provider_limits, "true");

} // namespace batchgate::config
