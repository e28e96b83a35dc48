#pragma once



#include <string>
#include "usb/usb.hh"
#include "options.hh"



namespace mdlink
{

std::string mdlink_version();
USBDeviceInfo mdlink_select_device(const Options &options);
void mdlink_print_devices(const Options &options);
int mdlink(Options &options);

}
