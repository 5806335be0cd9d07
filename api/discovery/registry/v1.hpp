#pragma once

#include "discovery/registry/v1/health.pb.h"
#include "discovery/registry/v1/instance.pb.h"
#include "discovery/registry/v1/interest.pb.h"
#include "discovery/registry/v1/notification.pb.h"
#include "discovery/registry/v1/replication.pb.h"
#include "discovery/registry/v1/services.pb.h"

#include "discovery/registry/v1/services.grpc.pb.h"
