#pragma once

void document_test(void);
