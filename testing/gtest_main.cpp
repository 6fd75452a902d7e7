#include "base/init.hpp"

#include <gtest/gtest.h>

int main(int argc, char* argv[]) {
    testing::InitGoogleTest(&argc, argv);
    pairrtc::Init(pairrtc::logging::Level::WARNING);
    int ret = RUN_ALL_TESTS();
    pairrtc::Cleanup();
    return ret;
}
