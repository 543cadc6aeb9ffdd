//===-- BuildRule.cpp -----------------------------------------------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2014 - 2015 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#include "rulekit/RuleKey/BuildRule.h"
#include "rulekit/RuleKey/RuleKeyAppendable.h"

using namespace rulekit;
using namespace rulekit::rulekey;

RuleKeyObjectSink::~RuleKeyObjectSink() {}

RuleKeyAppendable::~RuleKeyAppendable() {}

BuildRule::~BuildRule() {}

BuildRuleResolver::~BuildRuleResolver() {}
