// SPDX-License-Identifier: MIT
#define BOOST_TEST_MODULE idlkit
#include <boost/test/unit_test.hpp>
