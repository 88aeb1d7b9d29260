#include "tasks/builtin_tasks.h"

namespace stagehand {

void register_builtin_tasks(TaskRegistry& reg) {
    reg.registerTask(clean_task_desc());
    reg.registerTask(notarize_task_desc());
    reg.registerTask(overwrite_keystore_task_desc());
    reg.registerTask(patch_task_desc());
    reg.registerTask(set_extended_memory_limit_task_desc());
}

} // namespace stagehand
