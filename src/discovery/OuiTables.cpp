#include "OuiTables.h"

namespace cam_scan {

const std::vector<OuiEntry>& camera_oui_table(){
    static const std::vector<OuiEntry> table = {
        {"A0:CF:5B", "Hikvision"}, {"C0:56:E3", "Hikvision"}, {"54:C4:15", "Hikvision"},
        {"44:19:B6", "Hikvision"}, {"18:68:CB", "Hikvision"}, {"BC:AD:28", "Hikvision"},
        {"28:57:BE", "Hikvision"}, {"C4:2F:90", "Hikvision"}, {"4C:BD:8F", "Hikvision"},
        {"3C:EF:8C", "Dahua"}, {"90:02:A9", "Dahua"}, {"E0:50:8B", "Dahua"},
        {"4C:11:BF", "Dahua"}, {"A0:BD:1D", "Dahua"}, {"40:F4:FD", "Dahua"},
        {"00:40:8C", "Axis"}, {"AC:CC:8E", "Axis"}, {"B8:A4:4F", "Axis"},
        {"00:09:18", "Hanwha"}, {"00:16:6C", "Samsung"}, {"00:1A:B6", "Samsung"},
        {"00:02:D1", "Vivotek"}, {"00:22:F7", "Vivotek"},
        {"00:04:13", "Bosch"}, {"00:07:5F", "Bosch"},
        {"00:80:F0", "Panasonic"}, {"00:B0:C7", "Panasonic"}, {"04:20:9A", "Panasonic"},
        {"00:04:1F", "Sony"}, {"00:13:A9", "Sony"},
        {"24:24:05", "Uniview"}, {"24:28:FD", "Uniview"},
        {"EC:71:DB", "Reolink"}, {"9C:8E:CD", "Reolink"},
        // shared block: Amcrest overrides the Reolink entry above
        {"9C:8E:CD", "Amcrest"},
        {"00:62:6E", "Foscam"}, {"C0:F6:C2", "Foscam"},
        {"50:C7:BF", "TP-Link"}, {"60:32:B1", "TP-Link"},
        {"24:A4:3C", "Ubiquiti"}, {"80:2A:A8", "Ubiquiti"}, {"FC:EC:DA", "Ubiquiti"},
        {"7C:D9:A0", "Turing"},
    };
    return table;
}

const std::vector<OuiEntry>& infrastructure_oui_table(){
    static const std::vector<OuiEntry> table = {
        {"00:00:0C", "Cisco"}, {"00:1B:D4", "Cisco"}, {"00:26:CB", "Cisco"},
        {"24:A4:3C", "Ubiquiti"}, {"80:2A:A8", "Ubiquiti"}, {"FC:EC:DA", "Ubiquiti"},
        {"74:83:C2", "Ubiquiti"}, {"F0:9F:C2", "Ubiquiti"},
        {"00:14:6C", "Netgear"}, {"00:1F:33", "Netgear"},
        {"50:C7:BF", "TP-Link"}, {"60:32:B1", "TP-Link"},
        {"00:0B:86", "Aruba"}, {"24:DE:C6", "Aruba"},
        {"00:18:0A", "Meraki"}, {"AC:17:C8", "Meraki"},
    };
    return table;
}

}
