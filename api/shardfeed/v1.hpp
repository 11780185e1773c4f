#pragma once

#include "shardfeed/v1/stream.pb.h"
