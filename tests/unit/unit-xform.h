#pragma once

void xform_test(void);
