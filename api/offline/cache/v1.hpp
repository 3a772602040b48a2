#pragma once

#include "offline/cache/v1/snapshot.pb.h"
#include "offline/cache/v1/sync.pb.h"
