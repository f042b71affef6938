#include "Privilege.h"
#include "Logging.h"
#include <unistd.h>
#ifdef CAM_SCAN_HAVE_LIBCAP
#include <sys/capability.h>
#endif

namespace cam_scan {

void log_capabilities(const std::string& context) {
#ifdef CAM_SCAN_HAVE_LIBCAP
    cap_t caps = cap_get_proc();
    if (!caps) {
        Logger::instance().warn("Failed to get current capabilities for " + context);
        return;
    }

    char* cap_text = cap_to_text(caps, nullptr);
    if (cap_text) {
        Logger::instance().debug("Capabilities " + context + ": " + std::string(cap_text));
        cap_free(cap_text);
    } else {
        Logger::instance().warn("Failed to convert capabilities to text for " + context);
    }

    cap_free(caps);
#else
    Logger::instance().debug("Capabilities logging not available (libcap not compiled in)");
#endif
}

bool drop_capabilities(bool keep_net_raw){
#ifdef CAM_SCAN_HAVE_LIBCAP
    Logger::instance().info("Dropping capabilities (keep_net_raw=" + std::string(keep_net_raw ? "true" : "false") + ")");
    log_capabilities("before drop");

    cap_t caps = cap_get_proc();
    if(!caps){
        Logger::instance().error("cap_get_proc failed");
        return false;
    }
    cap_clear(caps);
    if(keep_net_raw){
        cap_value_t v = CAP_NET_RAW;
        cap_set_flag(caps, CAP_PERMITTED, 1, &v, CAP_SET);
        cap_set_flag(caps, CAP_EFFECTIVE, 1, &v, CAP_SET);
        cap_set_flag(caps, CAP_INHERITABLE, 1, &v, CAP_SET);
    }
    bool ok = cap_set_proc(caps) == 0;
    cap_free(caps);
    if(!ok){
        Logger::instance().error("cap_set_proc failed");
        return false;
    }
    log_capabilities("after drop");
    return true;
#else
    (void)keep_net_raw;
    Logger::instance().warn("Capability dropping not available (libcap not compiled in)");
    return false;
#endif
}

bool is_privilege_available(){
#ifdef CAM_SCAN_HAVE_LIBCAP
    return true;
#else
    return false;
#endif
}

}
