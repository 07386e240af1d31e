// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <net/protocol.h>

namespace NetProtocol {

const char* HELLO = "hello";
const char* HELLOACK = "helloack";
const char* DEPTH = "depth";
const char* INSIGHTS = "insights";
const char* BYE = "bye";

} // namespace NetProtocol
