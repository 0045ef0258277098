#pragma once

#include "collab/graph/v1/graph.pb.h"
#include "collab/graph/v1/graph_service.pb.h"
