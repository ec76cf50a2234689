#pragma once

#include "config/config.pb.h"
#include "blueshare/session/v1/session.pb.h"

namespace blueshare::v1 {
using namespace ::blueshare::session::v1;
}
