#pragma once
//--------------------------------------------------------------
// User Defined Headers
//--------------------------------------------------------------
#include "FaultHushAPI.hpp"
#include "FaultReport.hpp"
#include "FaultHook.hpp"
#include "Fault.hpp"
#include "HushRegistry.hpp"
#include "HushGuard.hpp"
#include "HushPanic.hpp"
//--------------------------------------------------------------
