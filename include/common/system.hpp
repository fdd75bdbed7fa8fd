#pragma once

namespace grader {

/**
 * @brief 根据用户名查询用户 id
 * @param name 用户名或者十进制的用户 id
 * @return 用户 id，找不到该用户时返回 -1
 */
int get_userid(const char *name);

/**
 * @brief 根据组名查询组 id
 * @param name 组名或者十进制的组 id
 * @return 组 id，找不到该组时返回 -1
 */
int get_groupid(const char *name);

/**
 * @brief 查询用户的主组 id，找不到该用户时返回 -1
 */
int get_primary_groupid(int user_id);

}  // namespace grader
