#pragma once

/**
 * @file viewfinder.h
 * @brief Convenience header pulling in the public viewfinder API
 */

#include "viewfinder/api/Viewfinder.hpp"
#include "viewfinder/camera/CameraUtils.hpp"
#include "viewfinder/camera/SimulatedCamera.hpp"
#include "viewfinder/core/Configuration.hpp"
#include "viewfinder/core/Logger.hpp"
#include "viewfinder/core/exception.h"
#include "viewfinder/storage/PhotoSink.hpp"

#define VIEWFINDER_VERSION_MAJOR 1
#define VIEWFINDER_VERSION_MINOR 0
#define VIEWFINDER_VERSION_PATCH 0
