#include "dlog_test_common.h"

int main(int argc, char* argv[]) {
    testing::InitGoogleTest(&argc, argv);
    testing::AddGlobalTestEnvironment(new DLogEnvironment());
    return RUN_ALL_TESTS();
}
