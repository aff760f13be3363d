#pragma once

#include "slideshow/v1/types.pb.h"

#include "slideshow/v1/admin_service.pb.h"
#include "slideshow/v1/generation_service.pb.h"
#include "slideshow/v1/project_service.pb.h"

#include "slideshow/v1/admin_service.grpc.pb.h"
#include "slideshow/v1/generation_service.grpc.pb.h"
#include "slideshow/v1/project_service.grpc.pb.h"
