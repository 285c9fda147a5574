#pragma once

#include <megaflow/common/error_or_forward.h>
#include <megaflow/common/expected.h>
#include <megaflow/error.h>

