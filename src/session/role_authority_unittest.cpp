#include "session/role_authority.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/defines.hpp"

#include <utility>
#include <vector>

namespace pairrtc {
namespace test {

using Kind = signaling::Message::Kind;

MY_TEST(RoleAuthorityTest, StartAsInitiatorFromIdle) {
    std::vector<std::pair<Role, Role>> changes;
    RoleAuthority authority([&](Role old_role, Role new_role){
        changes.emplace_back(old_role, new_role);
    });
    EXPECT_EQ(authority.role(), Role::IDLE);
    EXPECT_TRUE(authority.StartAsInitiator());
    EXPECT_EQ(authority.role(), Role::INITIATOR);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].first, Role::IDLE);
    EXPECT_EQ(changes[0].second, Role::INITIATOR);
}

MY_TEST(RoleAuthorityTest, EntryPointsAreNoOpWhenNotIdle) {
    int change_count = 0;
    RoleAuthority authority([&](Role, Role){ ++change_count; });
    ASSERT_TRUE(authority.JoinAsResponder());
    EXPECT_FALSE(authority.StartAsInitiator());
    EXPECT_FALSE(authority.JoinAsResponder());
    EXPECT_EQ(authority.role(), Role::RESPONDER);
    EXPECT_EQ(change_count, 1);
}

MY_TEST(RoleAuthorityTest, EndSessionAlwaysTearsDown) {
    std::vector<Role> new_roles;
    RoleAuthority authority([&](Role, Role new_role){
        new_roles.push_back(new_role);
    });
    // Idle already
    authority.EndSession();
    authority.StartAsInitiator();
    authority.EndSession();
    EXPECT_EQ(authority.role(), Role::IDLE);
    EXPECT_EQ(new_roles, (std::vector<Role>{Role::IDLE, Role::INITIATOR, Role::IDLE}));

    // Re-enterable after ending.
    EXPECT_TRUE(authority.JoinAsResponder());
}

MY_TEST(RoleAuthorityTest, ProcessableMessageKinds) {
    EXPECT_FALSE(RoleAuthority::IsProcessable(Role::IDLE, Kind::OFFER));
    EXPECT_FALSE(RoleAuthority::IsProcessable(Role::IDLE, Kind::ANSWER));
    EXPECT_FALSE(RoleAuthority::IsProcessable(Role::IDLE, Kind::CANDIDATE));

    EXPECT_FALSE(RoleAuthority::IsProcessable(Role::INITIATOR, Kind::OFFER));
    EXPECT_TRUE(RoleAuthority::IsProcessable(Role::INITIATOR, Kind::ANSWER));
    EXPECT_TRUE(RoleAuthority::IsProcessable(Role::INITIATOR, Kind::CANDIDATE));

    EXPECT_TRUE(RoleAuthority::IsProcessable(Role::RESPONDER, Kind::OFFER));
    EXPECT_FALSE(RoleAuthority::IsProcessable(Role::RESPONDER, Kind::ANSWER));
    EXPECT_TRUE(RoleAuthority::IsProcessable(Role::RESPONDER, Kind::CANDIDATE));

    RoleAuthority authority(nullptr);
    authority.StartAsInitiator();
    EXPECT_TRUE(authority.IsProcessable(Kind::ANSWER));
    EXPECT_FALSE(authority.IsProcessable(Kind::OFFER));
}

} // namespace test
} // namespace pairrtc
