#pragma once

// Shared declarations for the test runner.
//
// Each suite defines its own local ALLTZ_ASSERT macro and returns 0 on success,
// 1 on the first failed assertion.

#include <cstdint>
#include <iostream>
#include <string>

int test_civil_time();
int test_time_zone();
int test_zone_catalog();
int test_activity();
int test_time_mapper();
int test_dst_detector();
int test_label_placer();
int test_buffer();
int test_timeline_widget();
int test_json_errors();
int test_app_config();
int test_ansi();
int test_strings();
